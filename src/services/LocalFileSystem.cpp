#include "services/LocalFileSystem.hpp"

#include "util/FileDescriptor.hpp"
#include "util/WriteHelpers.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <vector>

namespace local_fs {

namespace {

auto copy_directory(const std::filesystem::path& source, const std::filesystem::path& destination,
                    bool overwrite) -> std::expected<uint64_t, util::Error> {
    std::error_code ec;
    auto options = std::filesystem::copy_options::recursive;
    options |= overwrite ? std::filesystem::copy_options::overwrite_existing
                         : std::filesystem::copy_options::skip_existing;

    std::filesystem::copy(source, destination, options, ec);
    if (ec) {
        return std::unexpected(util::error_from_code("Failed to copy directory", ec));
    }
    return 0;
}

}  // namespace

auto exists(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

auto is_directory(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

auto file_size(const std::filesystem::path& path) -> uint64_t {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return 0;
    }
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

auto copy_file(const std::filesystem::path& source, const std::filesystem::path& destination,
               bool overwrite, size_t buffer_size, const TransferProgressCallback& progress)
    -> std::expected<uint64_t, util::Error> {
    if (local_fs::is_directory(source)) {
        return copy_directory(source, destination, overwrite);
    }

    auto input = util::FileDescriptor::open(source, O_RDONLY);
    if (!input) {
        return std::unexpected(input.error());
    }

    struct stat source_stat {};
    if (::fstat(input->get(), &source_stat) != 0) {
        return std::unexpected(util::error_from_errno("Failed to stat " + source.string(), errno));
    }

    const int create_flags = O_WRONLY | O_CREAT | (overwrite ? O_TRUNC : O_EXCL);
    auto output = util::FileDescriptor::open(destination, create_flags, source_stat.st_mode & 0777);
    if (!output) {
        return std::unexpected(output.error());
    }

    const auto total = static_cast<uint64_t>(source_stat.st_size);
    std::vector<char> buffer(buffer_size > 0 ? buffer_size : 64 * 1024);
    uint64_t copied = 0;

    auto fail = [&destination, &output](util::Error error) -> std::expected<uint64_t, util::Error> {
        output->reset();
        std::error_code ec;
        std::filesystem::remove(destination, ec);
        return std::unexpected(std::move(error));
    };

    if (progress) {
        progress(0, total);
    }

    while (true) {
        const auto bytes_read = util::read_with_retry(input->get(), buffer.data(), buffer.size());
        if (bytes_read < 0) {
            return fail(util::error_from_errno("Failed to read " + source.string(), errno));
        }
        if (bytes_read == 0) {
            break;
        }
        if (!util::write_all(output->get(), buffer.data(), static_cast<size_t>(bytes_read))) {
            return fail(util::error_from_errno("Failed to write " + destination.string(), errno));
        }
        copied += static_cast<uint64_t>(bytes_read);
        if (progress) {
            progress(copied, total);
        }
    }

    if (auto closed = output->close(); !closed) {
        return fail(closed.error());
    }

    return copied;
}

auto rename_path(const std::filesystem::path& from, const std::filesystem::path& to)
    -> std::expected<void, util::Error> {
    if (std::rename(from.c_str(), to.c_str()) != 0) {
        return std::unexpected(util::error_from_errno("Failed to rename " + from.string(), errno));
    }
    return {};
}

auto remove_path(const std::filesystem::path& path) -> std::expected<void, util::Error> {
    if (!local_fs::exists(path)) {
        return std::unexpected(util::Error{path.filename().string() + " not found",
                                           util::ErrorKind::NOT_FOUND});
    }

    std::error_code ec;
    if (local_fs::is_directory(path)) {
        std::filesystem::remove_all(path, ec);
    } else {
        std::filesystem::remove(path, ec);
    }
    if (ec) {
        return std::unexpected(util::error_from_code("Failed to delete " + path.string(), ec));
    }
    return {};
}

auto ensure_directory(const std::filesystem::path& path) -> std::expected<void, util::Error> {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return {};
    }
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return std::unexpected(
            util::error_from_code("Failed to create directory " + path.string(), ec));
    }
    return {};
}

auto NativeFileSystem::copy_file(const std::filesystem::path& source,
                                 const std::filesystem::path& destination, bool overwrite,
                                 size_t buffer_size, const TransferProgressCallback& progress)
    -> std::expected<uint64_t, util::Error> {
    return local_fs::copy_file(source, destination, overwrite, buffer_size, progress);
}

auto NativeFileSystem::rename_path(const std::filesystem::path& from,
                                   const std::filesystem::path& to)
    -> std::expected<void, util::Error> {
    return local_fs::rename_path(from, to);
}

auto NativeFileSystem::remove_path(const std::filesystem::path& path)
    -> std::expected<void, util::Error> {
    return local_fs::remove_path(path);
}

auto native_file_system() -> std::shared_ptr<ILocalFileSystem> {
    static const auto instance = std::make_shared<NativeFileSystem>();
    return instance;
}

}  // namespace local_fs
