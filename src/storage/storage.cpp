#include "storage/storage.hpp"

#include "common/errors.hpp"
#include "storage/stream_id.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

namespace ember {

namespace {

// Redis-style strict integer parsing: the whole string, no whitespace, no '+'.
bool parse_i64(std::string_view sv, int64_t& out) {
    if (sv.empty() || sv.size() > 20) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

// First entry with id >= target (entries are sorted by id).
std::vector<StreamEntry>::const_iterator lower_bound_id(const Stream& stream,
                                                         const StreamId& target) {
    return std::lower_bound(
        stream.entries.begin(), stream.entries.end(), target,
        [](const StreamEntry& e, const StreamId& id) { return e.id < id; });
}

} // anonymous namespace

Storage::Storage(const Clock& clock)
    : clock_(clock) {}

Storage::Lock Storage::lock() const {
    return Lock{mutex_};
}

Entry* Storage::find_live(const std::string& key) {
    auto it = map_.find(key);
    if (it == map_.end()) {
        return nullptr;
    }
    if (it->second.expires_at && *it->second.expires_at <= clock_.now()) {
        erase(it);
        ++expired_total_;
        return nullptr;
    }
    return &it->second;
}

void Storage::erase(Map::iterator it) {
    if (it->second.expires_at) {
        deadlines_.erase({*it->second.expires_at, it->first});
    }
    map_.erase(it);
}

// ── Strings ──────────────────────────────────────────────────────────────────

std::error_code Storage::get_string(const std::string& key,
                                    std::optional<std::string>& out) {
    Lock guard(mutex_);
    Entry* entry = find_live(key);
    if (entry == nullptr) {
        out.reset();
        return {};
    }
    const auto* value = std::get_if<std::string>(&entry->value);
    if (value == nullptr) {
        return Errc::wrong_type;
    }
    out = *value;
    return {};
}

void Storage::set_string(std::string key, std::string value,
                         std::optional<Clock::time_point> expires_at) {
    Lock guard(mutex_);
    auto it = map_.find(key);
    if (it != map_.end()) {
        erase(it);
    }
    if (expires_at) {
        deadlines_.emplace(*expires_at, key);
    }
    map_.emplace(std::move(key), Entry{std::move(value), expires_at});
}

std::error_code Storage::incr(const std::string& key, int64_t& out) {
    Lock guard(mutex_);
    Entry* entry = find_live(key);
    if (entry == nullptr) {
        map_.emplace(key, Entry{std::string{"1"}, std::nullopt});
        out = 1;
        return {};
    }

    auto* value = std::get_if<std::string>(&entry->value);
    if (value == nullptr) {
        return Errc::wrong_type;
    }

    int64_t current = 0;
    if (!parse_i64(*value, current)) {
        return Errc::not_an_integer;
    }
    if (current == std::numeric_limits<int64_t>::max()) {
        return Errc::increment_overflow;
    }

    ++current;
    *value = std::to_string(current);
    out = current;
    return {};
}

// ── Lists ────────────────────────────────────────────────────────────────────

std::error_code Storage::list_push(const std::string& key, ListEnd end,
                                   const std::vector<std::string>& elements,
                                   std::size_t& new_length) {
    Lock guard(mutex_);
    Entry* entry = find_live(key);
    if (entry == nullptr) {
        entry = &map_.emplace(key, Entry{List{}, std::nullopt}).first->second;
    }

    auto* list = std::get_if<List>(&entry->value);
    if (list == nullptr) {
        return Errc::wrong_type;
    }

    for (const auto& element : elements) {
        if (end == ListEnd::Front) {
            list->push_front(element);
        } else {
            list->push_back(element);
        }
    }
    new_length = list->size();

    if (listener_ != nullptr) {
        listener_->on_list_push(key, *list);
    }
    if (list->empty()) {
        erase(map_.find(key));
    }
    return {};
}

std::error_code Storage::list_pop(const std::string& key, ListEnd end,
                                  std::size_t count, std::vector<std::string>& out) {
    Lock guard(mutex_);
    out.clear();
    Entry* entry = find_live(key);
    if (entry == nullptr) {
        return {};
    }

    auto* list = std::get_if<List>(&entry->value);
    if (list == nullptr) {
        return Errc::wrong_type;
    }

    const std::size_t n = std::min(count, list->size());
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (end == ListEnd::Front) {
            out.push_back(std::move(list->front()));
            list->pop_front();
        } else {
            out.push_back(std::move(list->back()));
            list->pop_back();
        }
    }

    if (list->empty()) {
        erase(map_.find(key));
    }
    return {};
}

std::error_code Storage::list_pop_first(
    const std::vector<std::string>& keys,
    std::optional<std::pair<std::string, std::string>>& out) {
    Lock guard(mutex_);
    out.reset();
    for (const auto& key : keys) {
        Entry* entry = find_live(key);
        if (entry == nullptr) {
            continue;
        }
        auto* list = std::get_if<List>(&entry->value);
        if (list == nullptr) {
            return Errc::wrong_type;
        }
        // Stored lists are never empty.
        out.emplace(key, std::move(list->front()));
        list->pop_front();
        if (list->empty()) {
            erase(map_.find(key));
        }
        return {};
    }
    return {};
}

std::error_code Storage::list_range(const std::string& key, int64_t start,
                                    int64_t stop, std::vector<std::string>& out) {
    Lock guard(mutex_);
    out.clear();
    Entry* entry = find_live(key);
    if (entry == nullptr) {
        return {};
    }

    const auto* list = std::get_if<List>(&entry->value);
    if (list == nullptr) {
        return Errc::wrong_type;
    }

    const auto n = static_cast<int64_t>(list->size());
    if (start < 0) start += n;
    if (stop < 0) stop += n;
    if (start < 0) start = 0;
    if (start > stop || start >= n) {
        return {};
    }
    if (stop >= n) stop = n - 1;

    out.assign(list->begin() + start, list->begin() + stop + 1);
    return {};
}

std::error_code Storage::list_len(const std::string& key, std::size_t& out) {
    Lock guard(mutex_);
    Entry* entry = find_live(key);
    if (entry == nullptr) {
        out = 0;
        return {};
    }
    const auto* list = std::get_if<List>(&entry->value);
    if (list == nullptr) {
        return Errc::wrong_type;
    }
    out = list->size();
    return {};
}

// ── Streams ──────────────────────────────────────────────────────────────────

std::error_code Storage::stream_add(const std::string& key, std::string_view id_spec,
                                    FieldValues fields, StreamId& out) {
    Lock guard(mutex_);
    Entry* entry = find_live(key);

    Stream* stream = nullptr;
    if (entry != nullptr) {
        stream = std::get_if<Stream>(&entry->value);
        if (stream == nullptr) {
            return Errc::wrong_type;
        }
    }

    // Resolve the ID before creating anything, so a rejected XADD leaves no key.
    StreamId id;
    const StreamId last = stream != nullptr ? stream->last_id : StreamId::min();
    if (auto ec = next_stream_id(id_spec, last, clock_.unix_ms(), id)) {
        return ec;
    }

    if (stream == nullptr) {
        entry = &map_.emplace(key, Entry{Stream{}, std::nullopt}).first->second;
        stream = &std::get<Stream>(entry->value);
    }

    stream->entries.push_back(StreamEntry{id, std::move(fields)});
    stream->last_id = id;
    out = id;

    if (listener_ != nullptr) {
        listener_->on_stream_append(key, id);
    }
    return {};
}

std::error_code Storage::stream_range(const std::string& key, const StreamId& start,
                                      const StreamId& end, std::size_t count,
                                      std::vector<StreamEntry>& out) {
    Lock guard(mutex_);
    out.clear();
    Entry* entry = find_live(key);
    if (entry == nullptr) {
        return {};
    }
    const auto* stream = std::get_if<Stream>(&entry->value);
    if (stream == nullptr) {
        return Errc::wrong_type;
    }

    for (auto it = lower_bound_id(*stream, start);
         it != stream->entries.end() && it->id <= end; ++it) {
        if (count != 0 && out.size() == count) {
            break;
        }
        out.push_back(*it);
    }
    return {};
}

std::error_code Storage::stream_read_after(const std::string& key, const StreamId& after,
                                           std::size_t count,
                                           std::vector<StreamEntry>& out) {
    Lock guard(mutex_);
    out.clear();
    Entry* entry = find_live(key);
    if (entry == nullptr) {
        return {};
    }
    const auto* stream = std::get_if<Stream>(&entry->value);
    if (stream == nullptr) {
        return Errc::wrong_type;
    }
    if (after == StreamId::max()) {
        return {};
    }

    const StreamId first = after.seq == std::numeric_limits<uint64_t>::max()
        ? StreamId{after.ms + 1, 0}
        : StreamId{after.ms, after.seq + 1};
    for (auto it = lower_bound_id(*stream, first); it != stream->entries.end(); ++it) {
        if (count != 0 && out.size() == count) {
            break;
        }
        out.push_back(*it);
    }
    return {};
}

std::error_code Storage::stream_last_id(const std::string& key, StreamId& out) {
    Lock guard(mutex_);
    Entry* entry = find_live(key);
    if (entry == nullptr) {
        out = StreamId::min();
        return {};
    }
    const auto* stream = std::get_if<Stream>(&entry->value);
    if (stream == nullptr) {
        return Errc::wrong_type;
    }
    out = stream->last_id;
    return {};
}

// ── Keyspace ─────────────────────────────────────────────────────────────────

ValueType Storage::type_of(const std::string& key) {
    Lock guard(mutex_);
    const Entry* entry = find_live(key);
    if (entry == nullptr) {
        return ValueType::None;
    }
    switch (entry->value.index()) {
        case 0: return ValueType::String;
        case 1: return ValueType::List;
        case 2: return ValueType::Stream;
        default: return ValueType::None;
    }
}

std::size_t Storage::size() const {
    Lock guard(mutex_);
    return map_.size();
}

std::size_t Storage::expiring_keys() const {
    Lock guard(mutex_);
    return deadlines_.size();
}

std::size_t Storage::purge_expired(std::size_t limit) {
    Lock guard(mutex_);
    const auto now = clock_.now();
    std::size_t removed = 0;
    while (removed < limit && !deadlines_.empty()) {
        const auto first = deadlines_.begin();
        if (first->first > now) {
            break;
        }
        auto it = map_.find(first->second);
        if (it != map_.end()) {
            erase(it);
            ++expired_total_;
        } else {
            deadlines_.erase(first);
        }
        ++removed;
    }
    return removed;
}

uint64_t Storage::expired_total() const {
    Lock guard(mutex_);
    return expired_total_;
}

void Storage::clear() {
    Lock guard(mutex_);
    map_.clear();
    deadlines_.clear();
}

} // namespace ember
