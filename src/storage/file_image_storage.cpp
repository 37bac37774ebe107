/**
 * @file file_image_storage.cpp
 * @brief Implementation of the filesystem image store
 */

#include <boxlink/storage/file_image_storage.hpp>

#include <boxlink/compat/format.hpp>

#include <charconv>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace boxlink::storage {

namespace {

constexpr const char* module_name = "file_image_storage";
constexpr const char* file_extension = ".dcm";

/// Generate a unique temporary filename
auto generate_temp_filename(const std::filesystem::path& base)
    -> std::filesystem::path {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;

    auto temp_name = base.filename().string() + ".tmp." + std::to_string(dist(gen));
    return base.parent_path() / temp_name;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

file_image_storage::file_image_storage(const file_image_storage_config& config)
    : config_(config) {
    if (config_.create_directories && !config_.root_path.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.root_path, ec);
        // Ignore error - will be caught during store operations
    }
    next_id_.store(scan_highest_id() + 1);
}

// ============================================================================
// image_storage Interface
// ============================================================================

Result<client::byte_buffer> file_image_storage::get_dataset(std::int64_t image_id,
                                                            bool /*with_pixel_data*/) {
    auto path = file_path(image_id);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return make_error<client::byte_buffer>(
            error_codes::dataset_not_found,
            boxlink::compat::format("Image {} not found", image_id), module_name);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error<client::byte_buffer>(
            error_codes::storage_read_error,
            "Failed to open " + path.string(), module_name);
    }

    client::byte_buffer data((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
    if (in.bad()) {
        return make_error<client::byte_buffer>(
            error_codes::storage_read_error,
            "Failed to read " + path.string(), module_name);
    }

    return ok(std::move(data));
}

Result<std::int64_t> file_image_storage::store_dataset(const client::byte_buffer& dataset) {
    auto image_id = next_id_.fetch_add(1);
    auto path = file_path(image_id);

    // Write to temporary file first
    auto temp_path = generate_temp_filename(path);
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return make_error<std::int64_t>(
                error_codes::storage_write_error,
                "Failed to create " + temp_path.string(), module_name);
        }
        out.write(reinterpret_cast<const char*>(dataset.data()),
                  static_cast<std::streamsize>(dataset.size()));
        if (!out) {
            std::error_code ec;
            out.close();
            std::filesystem::remove(temp_path, ec);
            return make_error<std::int64_t>(
                error_codes::storage_write_error,
                "Failed to write " + temp_path.string(), module_name);
        }
    }

    // Atomic rename
    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code remove_ec;
        std::filesystem::remove(temp_path, remove_ec);
        return make_error<std::int64_t>(
            error_codes::storage_write_error,
            "Failed to rename temp file: " + ec.message(), module_name);
    }

    return ok(image_id);
}

// ============================================================================
// Paths
// ============================================================================

std::filesystem::path file_image_storage::file_path(std::int64_t image_id) const {
    return config_.root_path / (std::to_string(image_id) + file_extension);
}

const std::filesystem::path& file_image_storage::root_path() const {
    return config_.root_path;
}

std::int64_t file_image_storage::scan_highest_id() const {
    std::int64_t highest = 0;

    std::error_code ec;
    if (!std::filesystem::is_directory(config_.root_path, ec)) {
        return highest;
    }

    for (const auto& item : std::filesystem::directory_iterator(config_.root_path, ec)) {
        if (!item.is_regular_file() || item.path().extension() != file_extension) {
            continue;
        }
        auto stem = item.path().stem().string();
        std::int64_t id = 0;
        auto [ptr, err] = std::from_chars(stem.data(), stem.data() + stem.size(), id);
        if (err == std::errc{} && ptr == stem.data() + stem.size() && id > highest) {
            highest = id;
        }
    }

    return highest;
}

}  // namespace boxlink::storage
