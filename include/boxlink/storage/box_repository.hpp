/**
 * @file box_repository.hpp
 * @brief Persistence of peer relationships (boxes)
 */

#pragma once

#include <boxlink/client/box_types.hpp>
#include <boxlink/core/result.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace boxlink::storage {

class box_database;

/**
 * @brief CRUD access to the boxes table
 *
 * Thread Safety: statements are serialized on the shared connection.
 */
class box_repository {
public:
    explicit box_repository(std::shared_ptr<box_database> db);
    ~box_repository();

    box_repository(const box_repository&) = delete;
    auto operator=(const box_repository&) -> box_repository& = delete;
    box_repository(box_repository&&) noexcept;
    auto operator=(box_repository&&) noexcept -> box_repository&;

    /**
     * @brief Insert a box and return its id
     *
     * Fails with duplicate_box if the token is already registered.
     */
    [[nodiscard]] auto insert(const client::box& b) -> Result<std::int64_t>;

    [[nodiscard]] auto find_by_id(std::int64_t id) const -> std::optional<client::box>;
    [[nodiscard]] auto find_by_token(std::string_view token) const
        -> std::optional<client::box>;
    [[nodiscard]] auto find_by_base_url(std::string_view base_url,
                                        client::send_method method) const
        -> std::optional<client::box>;
    [[nodiscard]] auto find_all() const -> std::vector<client::box>;
    [[nodiscard]] auto find_by_method(client::send_method method) const
        -> std::vector<client::box>;

    [[nodiscard]] auto update_online(std::int64_t id, bool online) -> VoidResult;

    /**
     * @brief Delete a box; outbox, inbox and tag rows cascade
     */
    [[nodiscard]] auto remove(std::int64_t id) -> VoidResult;

    [[nodiscard]] auto count() const -> std::size_t;

private:
    std::shared_ptr<box_database> db_;
};

}  // namespace boxlink::storage
