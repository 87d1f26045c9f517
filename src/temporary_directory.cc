#include <cstdlib>
#include <filesystem>
#include <runjudge/errmsg.hh>
#include <runjudge/logger.hh>
#include <runjudge/macros/throw.hh>
#include <runjudge/temporary_directory.hh>
#include <system_error>

TemporaryDirectory::TemporaryDirectory(std::string templ) {
    if (not templ.ends_with("XXXXXX")) {
        THROW("invalid temporary directory template: ", templ);
    }
    // Creates directory with permissions 0700
    if (mkdtemp(templ.data()) == nullptr) {
        THROW("mkdtemp('", templ, "')", errmsg());
    }

    std::error_code ec;
    auto path = std::filesystem::absolute(templ, ec);
    if (ec) {
        (void)std::filesystem::remove(templ, ec);
        THROW("Cannot make path absolute: ", templ);
    }
    path_ = path.lexically_normal().string();
    if (path_.back() != '/') {
        path_ += '/';
    }
}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& td) {
    if (exists()) {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            THROW("remove_all('", path_, "') - ", ec.message());
        }
    }

    path_ = std::move(td.path_);
    td.path_.clear();
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists()) {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            // We cannot throw from the destructor
            errlog("Error: remove_all('", path_, "') - ", ec.message());
        }
    }
}
