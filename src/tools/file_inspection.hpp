#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace webscout {

// Structural checks on downloaded files. Each returns an object with a
// boolean "valid", plus "error" when the check could not pass.

// Opens the document with poppler-cpp: "pages" and "first_pages_text" (text of
// the first two pages, 600 bytes each). A file poppler cannot load is invalid.
nlohmann::json inspect_pdf(const std::string& path);

// ZIP container: local header, and the entry count from the end record.
nlohmann::json inspect_xlsx(const std::string& path);

// OLE2 compound document magic D0 CF 11 E0.
nlohmann::json inspect_xls(const std::string& path);

} // namespace webscout
