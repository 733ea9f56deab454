/**
 * @file HistoryStore.h
 * @brief Per-key linear undo/redo log over opaque snapshots
 *
 * Every key owns a non-empty list of snapshots and a cursor into it. Pushing
 * after an undo discards the redo tail, so history is always linear. The
 * store never looks inside a snapshot.
 */
#ifndef CIRCUITSKETCH_APP_HISTORY_HISTORYSTORE_H
#define CIRCUITSKETCH_APP_HISTORY_HISTORYSTORE_H

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace circuitsketch::app::history {

/**
 * @brief Raised for operations on an unknown key or an invalid index
 */
class HistoryError : public std::out_of_range {
public:
    enum class Kind {
        UninitializedKey,
        IndexOutOfRange
    };

    HistoryError(Kind kind, const std::string& what)
        : std::out_of_range(what),
          kind_(kind) {
    }

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

template <typename Key, typename Snapshot>
class HistoryStore {
public:
    /**
     * @param capacity Maximum states kept per key, 0 for unbounded
     */
    explicit HistoryStore(std::size_t capacity = 0) {
        setCapacity(capacity);
    }

    std::size_t capacity() const { return capacity_; }

    /**
     * @brief Applies to later pushes; existing logs are not trimmed
     *
     * A capacity of 1 is raised to 2 so that one undo step always exists.
     */
    void setCapacity(std::size_t capacity) {
        capacity_ = capacity == 1 ? 2 : capacity;
    }

    /**
     * @brief Start a log for @p key; no-op if the key already exists
     */
    void initialize(const Key& key, Snapshot initial) {
        if (entries_.count(key) != 0) {
            return;
        }
        Entry entry;
        entry.states.push_back(std::move(initial));
        entries_.emplace(key, std::move(entry));
    }

    /**
     * @brief Append a state, discarding any redo tail first
     */
    void push(const Key& key, Snapshot state) {
        Entry& entry = entryFor(key);
        entry.states.erase(entry.states.begin() + static_cast<std::ptrdiff_t>(entry.currentIndex) + 1,
                           entry.states.end());
        entry.states.push_back(std::move(state));
        if (capacity_ > 0 && entry.states.size() > capacity_) {
            const std::size_t excess = entry.states.size() - capacity_;
            entry.states.erase(entry.states.begin(),
                               entry.states.begin() + static_cast<std::ptrdiff_t>(excess));
        }
        entry.currentIndex = entry.states.size() - 1;
    }

    /**
     * @brief Drop the newest state; the log never shrinks below one state
     *
     * The cursor moves to the new last state, even if an undo had left it
     * further back.
     */
    void popLatest(const Key& key) {
        Entry& entry = entryFor(key);
        if (entry.states.size() <= 1) {
            return;
        }
        entry.states.pop_back();
        entry.currentIndex = entry.states.size() - 1;
    }

    const Snapshot& undo(const Key& key) {
        Entry& entry = entryFor(key);
        if (entry.currentIndex > 0) {
            --entry.currentIndex;
        }
        return entry.states[entry.currentIndex];
    }

    const Snapshot& redo(const Key& key) {
        Entry& entry = entryFor(key);
        if (entry.currentIndex + 1 < entry.states.size()) {
            ++entry.currentIndex;
        }
        return entry.states[entry.currentIndex];
    }

    /**
     * @brief Jump the cursor to @p index
     * @throws HistoryError (IndexOutOfRange) if @p index is not a valid state
     */
    const Snapshot& restore(const Key& key, std::size_t index) {
        Entry& entry = entryFor(key);
        if (index >= entry.states.size()) {
            throw HistoryError(HistoryError::Kind::IndexOutOfRange,
                               "history index " + std::to_string(index) + " out of range [0, " +
                                   std::to_string(entry.states.size()) + ")");
        }
        entry.currentIndex = index;
        return entry.states[index];
    }

    const Snapshot& current(const Key& key) const {
        const Entry& entry = entryFor(key);
        return entry.states[entry.currentIndex];
    }

    /**
     * @brief Copy of every state, oldest first
     */
    std::vector<Snapshot> list(const Key& key) const {
        return entryFor(key).states;
    }

    std::size_t size(const Key& key) const { return entryFor(key).states.size(); }
    std::size_t cursor(const Key& key) const { return entryFor(key).currentIndex; }

    bool contains(const Key& key) const { return entries_.count(key) != 0; }

    bool canUndo(const Key& key) const {
        auto it = entries_.find(key);
        return it != entries_.end() && it->second.currentIndex > 0;
    }

    bool canRedo(const Key& key) const {
        auto it = entries_.find(key);
        return it != entries_.end() && it->second.currentIndex + 1 < it->second.states.size();
    }

    std::vector<Key> keys() const {
        std::vector<Key> result;
        result.reserve(entries_.size());
        for (const auto& item : entries_) {
            result.push_back(item.first);
        }
        return result;
    }

    /**
     * @brief Remove one log; the key must be initialized again before reuse
     */
    void clear(const Key& key) {
        entryFor(key);
        entries_.erase(key);
    }

    void clearAll() { entries_.clear(); }

private:
    struct Entry {
        std::vector<Snapshot> states;
        std::size_t currentIndex = 0;
    };

    Entry& entryFor(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            throw HistoryError(HistoryError::Kind::UninitializedKey, "history key is not initialized");
        }
        return it->second;
    }

    const Entry& entryFor(const Key& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            throw HistoryError(HistoryError::Kind::UninitializedKey, "history key is not initialized");
        }
        return it->second;
    }

    std::size_t capacity_ = 0;
    std::map<Key, Entry> entries_;
};

} // namespace circuitsketch::app::history

#endif // CIRCUITSKETCH_APP_HISTORY_HISTORYSTORE_H
