#include "output.hpp"
#include "util.hpp"
#include <algorithm>

namespace cronkit {

static const std::vector<std::string> kFormats = {"table", "json", "csv", "ids"};

Formatter::Formatter(std::string format, std::vector<std::string> fields)
    : format_(std::move(format)), fields_(std::move(fields)) {}

Formatter Formatter::from_args(const std::string& format,
                               const std::string& fields,
                               const std::vector<std::string>& default_fields) {
    std::vector<std::string> selected;
    for (const auto& f : split(fields, ',')) {
        std::string name = trim(f);
        if (!name.empty()) selected.push_back(name);
    }
    if (selected.empty()) selected = default_fields;
    return Formatter(format.empty() ? "table" : format, std::move(selected));
}

std::string Formatter::validate(const std::vector<std::string>& available_fields) const {
    if (std::find(kFormats.begin(), kFormats.end(), format_) == kFormats.end()) {
        return "Invalid format: " + format_;
    }
    for (const auto& f : fields_) {
        if (std::find(available_fields.begin(), available_fields.end(), f) ==
            available_fields.end()) {
            return "Invalid field: " + f;
        }
    }
    return "";
}

std::string cell_text(const nlohmann::json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "1" : "";
    return value.dump();
}

std::string csv_escape(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string Formatter::render(const std::vector<nlohmann::json>& items,
                              const std::string& id_field) const {
    if (format_ == "ids") {
        std::vector<std::string> ids;
        ids.reserve(items.size());
        for (const auto& item : items) {
            ids.push_back(cell_text(item.value(id_field, nlohmann::json())));
        }
        return join(ids, " ");
    }
    if (format_ == "json") return render_json(items);
    if (format_ == "csv") return render_csv(items);
    return render_table(items);
}

std::string Formatter::render_table(const std::vector<nlohmann::json>& items) const {
    if (items.empty()) return "";

    // Column widths from header and cell text
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> widths;
    for (const auto& f : fields_) widths.push_back(f.size());
    for (const auto& item : items) {
        std::vector<std::string> row;
        for (size_t i = 0; i < fields_.size(); ++i) {
            std::string text = cell_text(item.value(fields_[i], nlohmann::json()));
            widths[i] = std::max(widths[i], text.size());
            row.push_back(std::move(text));
        }
        rows.push_back(std::move(row));
    }

    std::string border = "+";
    for (size_t w : widths) border += std::string(w + 2, '-') + "+";
    border += "\n";

    auto format_row = [&widths](const std::vector<std::string>& cells) {
        std::string line = "|";
        for (size_t i = 0; i < cells.size(); ++i) {
            line += " " + cells[i] + std::string(widths[i] - cells[i].size(), ' ') + " |";
        }
        return line + "\n";
    };

    std::string out = border + format_row(fields_) + border;
    for (const auto& row : rows) out += format_row(row);
    out += border;
    return out;
}

std::string Formatter::render_json(const std::vector<nlohmann::json>& items) const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : items) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& f : fields_) {
            obj[f] = item.value(f, nlohmann::json());
        }
        arr.push_back(std::move(obj));
    }
    return arr.dump() + "\n";
}

std::string Formatter::render_csv(const std::vector<nlohmann::json>& items) const {
    std::vector<std::string> header;
    for (const auto& f : fields_) header.push_back(csv_escape(f));
    std::string out = join(header, ",") + "\n";
    for (const auto& item : items) {
        std::vector<std::string> cells;
        for (const auto& f : fields_) {
            cells.push_back(csv_escape(cell_text(item.value(f, nlohmann::json()))));
        }
        out += join(cells, ",") + "\n";
    }
    return out;
}

} // namespace cronkit
