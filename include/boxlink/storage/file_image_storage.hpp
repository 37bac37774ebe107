/**
 * @file file_image_storage.hpp
 * @brief Filesystem-backed image store
 */

#pragma once

#include <boxlink/storage/image_storage.hpp>

#include <atomic>
#include <filesystem>

namespace boxlink::storage {

/**
 * @brief Configuration for file_image_storage
 */
struct file_image_storage_config {
    /// Directory holding one "<image id>.dcm" file per image
    std::filesystem::path root_path;

    /// Create root_path if it does not exist
    bool create_directories{true};
};

/**
 * @brief Stores each dataset as "<root>/<image id>.dcm"
 *
 * New ids continue after the highest id found in the directory when the
 * store is constructed. Writes go to a temporary file which is then renamed
 * into place.
 */
class file_image_storage final : public image_storage {
public:
    explicit file_image_storage(const file_image_storage_config& config);
    ~file_image_storage() override = default;

    file_image_storage(const file_image_storage&) = delete;
    auto operator=(const file_image_storage&) -> file_image_storage& = delete;

    [[nodiscard]] auto get_dataset(std::int64_t image_id, bool with_pixel_data)
        -> Result<client::byte_buffer> override;

    [[nodiscard]] auto store_dataset(const client::byte_buffer& dataset)
        -> Result<std::int64_t> override;

    [[nodiscard]] auto file_path(std::int64_t image_id) const -> std::filesystem::path;

    [[nodiscard]] auto root_path() const -> const std::filesystem::path&;

private:
    [[nodiscard]] auto scan_highest_id() const -> std::int64_t;

    file_image_storage_config config_;
    std::atomic<std::int64_t> next_id_{1};
};

}  // namespace boxlink::storage
