#include <xpoint-cpp/index_registry.hpp>

#include "executor.hpp"
#include "log.hpp"

#include <exception>
#include <optional>

namespace xpoint_cpp {

auto IndexRegistry::slot_for(const std::string& book_id) -> std::shared_ptr<Slot> {
    {
        auto lock = std::shared_lock{mutex_};
        if (auto it = slots_.find(book_id); it != slots_.end()) return it->second;
    }
    auto lock = std::unique_lock{mutex_};
    auto& slot = slots_[book_id];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

auto IndexRegistry::existing_slot(const std::string& book_id) const -> std::shared_ptr<Slot> {
    auto lock = std::shared_lock{mutex_};
    auto it = slots_.find(book_id);
    return it == slots_.end() ? nullptr : it->second;
}

auto IndexRegistry::lock_slot(const std::string& book_id) -> LockedSlot {
    // erase() may detach the slot while we wait for its build lock; retry
    // until the locked slot is the one registered for the book.
    for (;;) {
        auto slot = slot_for(book_id);
        auto build_lock = std::unique_lock{slot->build_mutex};
        if (existing_slot(book_id) == slot) return LockedSlot{std::move(slot), std::move(build_lock)};
    }
}

auto IndexRegistry::build(const std::string& book_id,
                          std::span<const DocumentFragment> fragments,
                          std::stop_token stop) -> Result<Snapshot> {
    auto [slot, build_lock] = lock_slot(book_id);

    auto built = build_position_index(book_id, fragments, stop);
    if (!built) {
        detail::logger().warn("rebuild of book '{}' failed, keeping previous index: {}",
                              book_id, built.error().message);
        return built.error();
    }

    auto snapshot = std::make_shared<const PositionIndex>(std::move(*built));
    {
        auto lock = std::unique_lock{slot->mutex};
        slot->current = snapshot;
    }
    return snapshot;
}

auto IndexRegistry::build_all(const std::vector<BookSource>& books,
                              std::stop_token stop) -> std::vector<Result<Snapshot>> {
    auto slots = std::vector<std::optional<Result<Snapshot>>>(books.size());

    detail::parallel_for(books.size(), [&](std::size_t i) {
        try {
            slots[i] = build(books[i].book_id, books[i].fragments, stop);
        } catch (const std::exception& e) {
            detail::logger().error("build of book '{}' threw: {}", books[i].book_id, e.what());
            slots[i] = Error{ErrorKind::index_build_failed,
                             "book '" + books[i].book_id + "': " + e.what()};
        }
    });

    auto results = std::vector<Result<Snapshot>>{};
    results.reserve(books.size());
    for (auto& slot : slots) results.push_back(std::move(*slot));
    return results;
}

auto IndexRegistry::install(PositionIndex index) -> Snapshot {
    auto [slot, build_lock] = lock_slot(index.book_id());
    auto snapshot = std::make_shared<const PositionIndex>(std::move(index));
    auto lock = std::unique_lock{slot->mutex};
    slot->current = snapshot;
    return snapshot;
}

auto IndexRegistry::find(const std::string& book_id) const -> Snapshot {
    auto slot = existing_slot(book_id);
    if (!slot) return nullptr;
    auto lock = std::shared_lock{slot->mutex};
    return slot->current;
}

auto IndexRegistry::erase(const std::string& book_id) -> bool {
    auto slot = existing_slot(book_id);
    if (!slot) return false;
    auto build_lock = std::scoped_lock{slot->build_mutex};
    {
        auto lock = std::unique_lock{mutex_};
        if (auto it = slots_.find(book_id); it != slots_.end() && it->second == slot) slots_.erase(it);
    }
    auto lock = std::unique_lock{slot->mutex};
    auto had_index = slot->current != nullptr;
    slot->current.reset();
    return had_index;
}

auto IndexRegistry::slot_count() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return slots_.size();
}

auto IndexRegistry::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    auto count = std::size_t{0};
    for (const auto& [book_id, slot] : slots_) {
        auto slot_lock = std::shared_lock{slot->mutex};
        if (slot->current) ++count;
    }
    return count;
}

}  // namespace xpoint_cpp
