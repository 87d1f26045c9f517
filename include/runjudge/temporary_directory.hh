#pragma once

#include <string>

class TemporaryDirectory {
    std::string path_; // absolute path with trailing '/'

public:
    TemporaryDirectory() = default; // Does NOT create a temporary directory

    // The last six characters of @p templ must be "XXXXXX"
    explicit TemporaryDirectory(std::string templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&&) noexcept = default;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&& td);

    ~TemporaryDirectory();

    // Returns true if object holds a real temporary directory
    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    // Directory absolute path with trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};
