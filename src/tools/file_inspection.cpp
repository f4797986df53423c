#include "file_inspection.hpp"
#include "../utils.hpp"
#include <poppler-document.h>
#include <poppler-page.h>
#include <algorithm>
#include <memory>
#include <vector>

namespace webscout {

namespace {

constexpr int kPreviewPages = 2;
constexpr size_t kPreviewPageChars = 600;

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n\f");
    if (b == std::string::npos) return "";
    return s.substr(b, s.find_last_not_of(" \t\r\n\f") - b + 1);
}

} // namespace

static bool read_whole(const std::string& path, std::string& data, nlohmann::json& err) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        err = {{"valid", false}, {"error", "file not found: " + path}};
        return false;
    }
    data = read_file(path);
    return true;
}

nlohmann::json inspect_pdf(const std::string& path) {
    std::string data;
    nlohmann::json err;
    if (!read_whole(path, data, err)) return err;

    if (data.compare(0, 5, "%PDF-") != 0) {
        return {{"valid", false}, {"pages", nullptr}, {"error", "invalid header"}};
    }

    std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(path));
    if (!doc) {
        return {{"valid", false}, {"pages", nullptr}, {"error", "PDF cannot be opened (damaged or truncated)"}};
    }

    int pages = doc->pages();
    std::vector<std::string> parts;
    if (!doc->is_locked()) {
        for (int i = 0; i < std::min(kPreviewPages, pages); i++) {
            std::unique_ptr<poppler::page> page(doc->create_page(i));
            if (!page) continue;
            auto bytes = page->text().to_utf8();
            std::string text = trim(std::string(bytes.begin(), bytes.end()));
            if (!text.empty()) parts.push_back(truncate_utf8(text, kPreviewPageChars));
        }
    }

    std::string joined;
    for (auto& p : parts) {
        if (!joined.empty()) joined += "\n---\n";
        joined += p;
    }
    return {
        {"valid", true},
        {"pages", pages},
        {"encrypted", doc->is_locked()},
        {"first_pages_text", joined.empty() ? std::string("(no extractable text)") : joined}
    };
}

nlohmann::json inspect_xlsx(const std::string& path) {
    std::string data;
    nlohmann::json err;
    if (!read_whole(path, data, err)) return err;

    static const std::string local_header("PK\x03\x04", 4);
    static const std::string end_record("PK\x05\x06", 4);

    if (data.compare(0, 4, local_header) != 0) {
        return {{"valid", false}, {"is_zip", false}, {"error", "File is not a zip file"}};
    }
    // End of central directory: signature, disk numbers, entries on this disk,
    // total entries (offset 10, little endian), sizes, comment length.
    size_t eocd = data.rfind(end_record);
    if (eocd == std::string::npos) {
        return {{"valid", false}, {"is_zip", false}, {"error", "zip end of central directory record not found"}};
    }
    if (eocd + 22 > data.size()) {
        return {{"valid", false}, {"is_zip", false}, {"error", "zip end of central directory record truncated"}};
    }
    int entries = static_cast<unsigned char>(data[eocd + 10]) |
                  (static_cast<unsigned char>(data[eocd + 11]) << 8);
    return {{"valid", true}, {"entries", entries}, {"is_zip", true}};
}

nlohmann::json inspect_xls(const std::string& path) {
    std::string data;
    nlohmann::json err;
    if (!read_whole(path, data, err)) return err;

    static const std::string ole_magic("\xD0\xCF\x11\xE0", 4);
    bool is_ole = data.compare(0, 4, ole_magic) == 0;
    nlohmann::json info = {{"valid", is_ole}, {"is_ole", is_ole}};
    if (!is_ole) info["error"] = "missing OLE2 signature";
    return info;
}

} // namespace webscout
