#pragma once
// gridseries CSV library: point geographies (monitoring sites, residences)
// from an RFC 4180 CSV file via rapidcsv.
//
//   site_id,longitude,latitude,state
//   A1,-71.06,42.36,MA
//
// The query's id_field names the id column; every extra metadata column is
// carried through to the output rows verbatim.

#include <gridseries/io/sources.hpp>

#include <string>
#include <vector>

namespace gridseries::csv {

class CsvPointSource final : public io::GeographySource {
   public:
    CsvPointSource(std::string x_column, std::string y_column,
                   std::vector<std::string> metadata_columns = {});

    [[nodiscard]] auto load(const io::GeographyQuery& query) const
        -> Result<GeographySet> override;

   private:
    std::string x_column_;
    std::string y_column_;
    std::vector<std::string> metadata_columns_;
};

}  // namespace gridseries::csv
