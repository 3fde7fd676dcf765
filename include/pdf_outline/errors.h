#pragma once

#include <stdexcept>
#include <string>

namespace pdf_outline {

// The PDF access layer could not open or parse a file. Fatal for that one
// document only.
class UnreadablePdf : public std::runtime_error {
public:
    UnreadablePdf(const std::string& path, const std::string& reason)
        : std::runtime_error("Unreadable PDF " + path + ": " + reason),
          path_(path),
          reason_(reason) {}

    const std::string& path() const { return path_; }
    const std::string& reason() const { return reason_; }

private:
    std::string path_;
    std::string reason_;
};

} // namespace pdf_outline
