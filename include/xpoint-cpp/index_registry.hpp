/// @file index_registry.hpp
/// @brief Per-book position indexes with atomic rebuild.

#pragma once

#include <xpoint-cpp/document.hpp>
#include <xpoint-cpp/error.hpp>
#include <xpoint-cpp/position_index.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace xpoint_cpp {

/// Holds the current PositionIndex for each book.
///
/// Readers take a shared snapshot and keep using it for as long as they
/// hold it. A rebuild publishes its result only on success: a failed or
/// cancelled rebuild leaves the previous index in place, so readers see
/// either the old index or the complete new one. Rebuilds of the same
/// book are serialized; rebuilds of different books run independently.
///
/// @code
/// auto registry = IndexRegistry{};
/// if (auto built = registry.build("book-1", fragments); !built) {
///     // registry.find("book-1") still returns the previous index, if any
/// }
/// @endcode
class IndexRegistry {
public:
    using Snapshot = std::shared_ptr<const PositionIndex>;

    /// Input for build_all().
    struct BookSource {
        std::string book_id;
        std::vector<DocumentFragment> fragments;
    };

    IndexRegistry() = default;
    IndexRegistry(const IndexRegistry&) = delete;
    auto operator=(const IndexRegistry&) -> IndexRegistry& = delete;

    /// Build an index for a book and install it if the build succeeds.
    /// @return The installed snapshot, or the build error (the previous
    ///   index, if any, stays current).
    auto build(const std::string& book_id,
               std::span<const DocumentFragment> fragments,
               std::stop_token stop = {}) -> Result<Snapshot>;

    /// Build several books in parallel on the global executor.
    /// @return One result per source, in input order.
    auto build_all(const std::vector<BookSource>& books,
                   std::stop_token stop = {}) -> std::vector<Result<Snapshot>>;

    /// Install an index built elsewhere (e.g. restored from a snapshot),
    /// replacing the current one for its book.
    auto install(PositionIndex index) -> Snapshot;

    /// Current index for a book, or nullptr if none is installed.
    auto find(const std::string& book_id) const -> Snapshot;

    /// Remove a book's index. Readers holding a snapshot keep it.
    /// @return true if an index was removed.
    auto erase(const std::string& book_id) -> bool;

    /// Number of books with an installed index.
    auto size() const -> std::size_t;

    /// Number of books the registry holds state for, installed or not.
    auto slot_count() const -> std::size_t;

private:
    struct Slot {
        std::mutex build_mutex;           // serializes rebuilds of this book
        mutable std::shared_mutex mutex;  // guards current
        Snapshot current;
    };

    auto slot_for(const std::string& book_id) -> std::shared_ptr<Slot>;
    auto existing_slot(const std::string& book_id) const -> std::shared_ptr<Slot>;

    struct LockedSlot {
        std::shared_ptr<Slot> slot;
        std::unique_lock<std::mutex> build_lock;
    };

    // Slot registered for book_id with its build lock held.
    auto lock_slot(const std::string& book_id) -> LockedSlot;

    mutable std::shared_mutex mutex_;  // guards slots_
    std::map<std::string, std::shared_ptr<Slot>> slots_;
};

}  // namespace xpoint_cpp
