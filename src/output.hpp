#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cronkit {

// Renders a list of records (JSON objects) in one of the listing formats:
// table, json, csv or ids.
class Formatter {
public:
    Formatter(std::string format, std::vector<std::string> fields);

    // Build from --format / --fields values; an empty fields string selects
    // default_fields.
    static Formatter from_args(const std::string& format,
                               const std::string& fields,
                               const std::vector<std::string>& default_fields);

    // Empty when the format and every field are valid, otherwise the error
    // message ("Invalid format: x" / "Invalid field: y").
    std::string validate(const std::vector<std::string>& available_fields) const;

    const std::string& format() const { return format_; }
    const std::vector<std::string>& fields() const { return fields_; }

    // id_field names the value printed by the ids format.
    std::string render(const std::vector<nlohmann::json>& items,
                       const std::string& id_field) const;

private:
    std::string render_table(const std::vector<nlohmann::json>& items) const;
    std::string render_json(const std::vector<nlohmann::json>& items) const;
    std::string render_csv(const std::vector<nlohmann::json>& items) const;

    std::string format_;
    std::vector<std::string> fields_;
};

// Cell text for a JSON value: strings verbatim, null empty, others dumped
std::string cell_text(const nlohmann::json& value);

// Quote a CSV cell when it holds a comma, quote or line break
std::string csv_escape(const std::string& value);

} // namespace cronkit
