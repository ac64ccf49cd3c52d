#include <vista/discard_history.hpp>
#include <vista/log.hpp>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace vista {

// ---------------------------------------------------------------------------
// Binary format
// ---------------------------------------------------------------------------
//
//   magic "VDH\x01"
//   varint n_whole, n_whole x entry
//   varint n_partial, n_partial x (string key, varint n, n x entry)
//   entry    := varint n_snapshots, n x (string path, string before, string after)
//   string   := varint length, bytes

static const char MAGIC[] = "VDH\x01";
static constexpr size_t MAGIC_LEN = 4;

namespace ser {

static void write_varint(std::string& buf, uint64_t val) {
    while (val >= 0x80) {
        buf.push_back(static_cast<char>((val & 0x7F) | 0x80));
        val >>= 7;
    }
    buf.push_back(static_cast<char>(val));
}

static bool read_varint(const uint8_t*& p, const uint8_t* end, uint64_t& val) {
    val = 0;
    unsigned shift = 0;
    while (p < end) {
        uint8_t b = *p++;
        val |= static_cast<uint64_t>(b & 0x7F) << shift;
        if (!(b & 0x80)) return true;
        shift += 7;
        if (shift >= 64) return false;
    }
    return false;
}

static void write_string(std::string& buf, const std::string& s) {
    write_varint(buf, s.size());
    buf.append(s);
}

static bool read_string(const uint8_t*& p, const uint8_t* end, std::string& s) {
    uint64_t len;
    if (!read_varint(p, end, len)) return false;
    if (len > static_cast<uint64_t>(end - p)) return false;
    s.assign(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
    p += len;
    return true;
}

static void write_stack(std::string& buf, const std::vector<DiscardEntry>& stack) {
    write_varint(buf, stack.size());
    for (const auto& entry : stack) {
        write_varint(buf, entry.size());
        for (const auto& snap : entry) {
            write_string(buf, snap.path);
            write_string(buf, snap.before_sha);
            write_string(buf, snap.after_sha);
        }
    }
}

static bool read_stack(const uint8_t*& p, const uint8_t* end,
                       std::vector<DiscardEntry>& stack) {
    uint64_t n_entries;
    if (!read_varint(p, end, n_entries)) return false;
    // Every entry takes at least one byte
    if (n_entries > static_cast<uint64_t>(end - p)) return false;

    stack.clear();
    stack.reserve(static_cast<size_t>(n_entries));
    for (uint64_t i = 0; i < n_entries; ++i) {
        uint64_t n_snaps;
        if (!read_varint(p, end, n_snaps)) return false;
        if (n_snaps > static_cast<uint64_t>(end - p)) return false;

        DiscardEntry entry;
        entry.reserve(static_cast<size_t>(n_snaps));
        for (uint64_t j = 0; j < n_snaps; ++j) {
            DiscardSnapshot snap;
            if (!read_string(p, end, snap.path) ||
                !read_string(p, end, snap.before_sha) ||
                !read_string(p, end, snap.after_sha)) {
                return false;
            }
            entry.push_back(std::move(snap));
        }
        stack.push_back(std::move(entry));
    }
    return true;
}

} // namespace ser

bool DiscardHistory::empty() const {
    if (!whole_file.empty()) return false;
    for (const auto& [key, stack] : partial) {
        if (!stack.empty()) return false;
    }
    return true;
}

std::string serialize_discard_history(const DiscardHistory& history) {
    std::string buf(MAGIC, MAGIC_LEN);
    ser::write_stack(buf, history.whole_file);

    ser::write_varint(buf, history.partial.size());
    for (const auto& [key, stack] : history.partial) {
        ser::write_string(buf, key);
        ser::write_stack(buf, stack);
    }
    return buf;
}

Result<DiscardHistory> deserialize_discard_history(const std::string& bytes) {
    auto corrupt = [](const char* what) {
        return VistaError{VistaError::Parse,
            std::string("corrupt discard history: ") + what};
    };

    if (bytes.size() < MAGIC_LEN || std::memcmp(bytes.data(), MAGIC, MAGIC_LEN) != 0) {
        return corrupt("bad magic");
    }

    const uint8_t* p = reinterpret_cast<const uint8_t*>(bytes.data()) + MAGIC_LEN;
    const uint8_t* end = reinterpret_cast<const uint8_t*>(bytes.data()) + bytes.size();

    DiscardHistory history;
    if (!ser::read_stack(p, end, history.whole_file)) return corrupt("whole-file stack");

    uint64_t n_partial;
    if (!ser::read_varint(p, end, n_partial)) return corrupt("partial count");
    for (uint64_t i = 0; i < n_partial; ++i) {
        std::string key;
        std::vector<DiscardEntry> stack;
        if (!ser::read_string(p, end, key) || !ser::read_stack(p, end, stack)) {
            return corrupt("partial stack");
        }
        history.partial[key] = std::move(stack);
    }

    if (p != end) return corrupt("trailing bytes");
    return Result<DiscardHistory>::ok(std::move(history));
}

// ---------------------------------------------------------------------------
// GitObjectStore
// ---------------------------------------------------------------------------

Result<std::string> GitObjectStore::write_blob(const std::string& content) {
    return git_.write_blob(content);
}

Result<std::string> GitObjectStore::store_file(const std::string& path) {
    return git_.store_file(path);
}

Result<std::string> GitObjectStore::read_blob(const std::string& sha) {
    return git_.read_blob(sha);
}

Result<std::optional<std::string>> GitObjectStore::read_file(const std::string& path) {
    fs::path full = fs::path(git_.working_dir()) / path;
    std::error_code ec;
    if (!fs::is_regular_file(full, ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    std::ifstream in(full, std::ios::binary);
    if (!in) {
        return VistaError{VistaError::IO, "cannot read " + full.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::optional<std::string>>::ok(ss.str());
}

Status GitObjectStore::write_file(const std::string& path, const std::string& content) {
    fs::path full = fs::path(git_.working_dir()) / path;
    std::error_code ec;
    fs::create_directories(full.parent_path(), ec);

    std::ofstream out(full, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) {
        return VistaError{VistaError::IO, "cannot write " + full.string()};
    }
    return ok_status();
}

Status GitObjectStore::remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(fs::path(git_.working_dir()) / path, ec);
    if (ec) {
        return VistaError{VistaError::IO, "cannot remove " + path + ": " + ec.message()};
    }
    return ok_status();
}

Result<MergeFileResult> GitObjectStore::merge_text(const std::string& ours,
                                                   const std::string& base,
                                                   const std::string& theirs) {
    return git_.merge_file(ours, base, theirs);
}

Result<std::optional<std::string>> GitObjectStore::read_metadata(const std::string& key) {
    return git_.get_config(key, true);
}

Status GitObjectStore::write_metadata(const std::string& key, const std::string& value) {
    return git_.set_config(key, value);
}

// ---------------------------------------------------------------------------
// DiscardHistoryStore
// ---------------------------------------------------------------------------

DiscardHistoryStore::DiscardHistoryStore(ObjectStore& store, std::string metadata_key,
                                         size_t max_length)
    : store_(store),
      metadata_key_(std::move(metadata_key)),
      max_length_(max_length > 0 ? max_length : 1) {}

void DiscardHistoryStore::load() {
    DiscardHistory loaded;

    auto sha = store_.read_metadata(metadata_key_);
    if (sha.is_err()) {
        vista::log::warn("cannot read %s, starting with empty discard history: %s",
                         metadata_key_.c_str(), sha.error().message.c_str());
    } else if (!sha.value()) {
        vista::log::debug("no discard history recorded under %s", metadata_key_.c_str());
    } else {
        auto blob = store_.read_blob(*sha.value());
        if (blob.is_err()) {
            vista::log::warn("discard history %s unreadable, starting empty: %s",
                             sha.value()->c_str(), blob.error().message.c_str());
        } else {
            auto parsed = deserialize_discard_history(blob.value());
            if (parsed.is_err()) {
                vista::log::warn("discard history %s: %s",
                                 sha.value()->c_str(), parsed.error().message.c_str());
            } else {
                loaded = std::move(parsed).value();
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    history_ = std::move(loaded);
}

Result<std::vector<std::string>> DiscardHistoryStore::store_files(
        const std::vector<std::string>& paths) {
    std::vector<std::string> shas;
    shas.reserve(paths.size());
    for (const auto& path : paths) {
        auto sha = store_.store_file(path);
        if (sha.is_err()) return std::move(sha).error();
        shas.push_back(std::move(sha).value());
    }
    return Result<std::vector<std::string>>::ok(std::move(shas));
}

Result<DiscardEntry> DiscardHistoryStore::store_before_and_after_blobs(
        const std::vector<std::string>& paths, const SafetyCheck& is_safe,
        const Mutation& mutate, const std::string& group_key) {
    std::vector<std::string> safe;
    for (const auto& path : paths) {
        if (!is_safe || is_safe(path)) {
            safe.push_back(path);
        } else {
            vista::log::debug("not snapshotting %s", path.c_str());
        }
    }
    if (safe.empty()) return Result<DiscardEntry>::ok({});

    auto before = store_files(safe);
    if (before.is_err()) return std::move(before).error();

    if (mutate) VISTA_TRY(mutate());

    auto after = store_files(safe);
    if (after.is_err()) return std::move(after).error();

    DiscardEntry entry;
    entry.reserve(safe.size());
    for (size_t i = 0; i < safe.size(); ++i) {
        entry.push_back(DiscardSnapshot{safe[i], before.value()[i], after.value()[i]});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& stack = group_key.empty() ? history_.whole_file : history_.partial[group_key];
    stack.push_back(entry);
    if (stack.size() > max_length_) {
        stack.erase(stack.begin(), stack.begin() + (stack.size() - max_length_));
    }
    return Result<DiscardEntry>::ok(std::move(entry));
}

Result<std::string> DiscardHistoryStore::create_history_blob() {
    std::string bytes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bytes = serialize_discard_history(history_);
    }
    return store_.write_blob(bytes);
}

Result<std::string> DiscardHistoryStore::persist() {
    auto sha = create_history_blob();
    if (sha.is_err()) return std::move(sha).error();
    VISTA_TRY(store_.write_metadata(metadata_key_, sha.value()));
    vista::log::debug("discard history saved as %s", sha.value().c_str());
    return sha;
}

bool DiscardHistoryStore::has_history(const std::string& group_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (group_key.empty()) return !history_.whole_file.empty();
    auto it = history_.partial.find(group_key);
    return it != history_.partial.end() && !it->second.empty();
}

std::vector<DiscardEntry> DiscardHistoryStore::get_history(
        const std::string& group_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (group_key.empty()) return history_.whole_file;
    auto it = history_.partial.find(group_key);
    if (it == history_.partial.end()) return {};
    return it->second;
}

std::optional<DiscardEntry> DiscardHistoryStore::get_last_snapshots(
        const std::string& group_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::vector<DiscardEntry>* stack = &history_.whole_file;
    if (!group_key.empty()) {
        auto it = history_.partial.find(group_key);
        if (it == history_.partial.end()) return std::nullopt;
        stack = &it->second;
    }
    if (stack->empty()) return std::nullopt;
    return stack->back();
}

std::optional<DiscardEntry> DiscardHistoryStore::pop(const std::string& group_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiscardEntry>* stack = &history_.whole_file;
    if (!group_key.empty()) {
        auto it = history_.partial.find(group_key);
        if (it == history_.partial.end()) return std::nullopt;
        stack = &it->second;
    }
    if (stack->empty()) return std::nullopt;

    DiscardEntry top = std::move(stack->back());
    stack->pop_back();
    if (!group_key.empty() && stack->empty()) history_.partial.erase(group_key);
    return top;
}

void DiscardHistoryStore::clear(const std::string& group_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (group_key.empty()) {
        history_.whole_file.clear();
    } else {
        history_.partial.erase(group_key);
    }
}

DiscardHistory DiscardHistoryStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

void DiscardHistoryStore::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_ = DiscardHistory();
}

Result<std::optional<std::string>> DiscardHistoryStore::read_optional_blob(
        const std::string& sha) {
    if (sha.empty()) return Result<std::optional<std::string>>::ok(std::nullopt);
    auto blob = store_.read_blob(sha);
    if (blob.is_err()) return std::move(blob).error();
    return Result<std::optional<std::string>>::ok(std::move(blob).value());
}

Result<RestoreResult> DiscardHistoryStore::restore_last(const std::string& group_key) {
    auto entry = get_last_snapshots(group_key);
    if (!entry) {
        return VistaError{VistaError::NotFound, "no discard history to restore",
            group_key.empty() ? "" : "group '" + group_key + "' is empty"};
    }

    RestoreResult result;
    for (const auto& snap : *entry) {
        auto current = store_.read_file(snap.path);
        if (current.is_err()) return std::move(current).error();
        auto after = read_optional_blob(snap.after_sha);
        if (after.is_err()) return std::move(after).error();
        auto before = read_optional_blob(snap.before_sha);
        if (before.is_err()) return std::move(before).error();

        if (current.value() == after.value()) {
            // Untouched since the discard
            if (before.value()) {
                VISTA_TRY(store_.write_file(snap.path, *before.value()));
            } else {
                VISTA_TRY(store_.remove_file(snap.path));
            }
            result.restored.push_back(snap.path);
            continue;
        }

        auto merged = store_.merge_text(current.value().value_or(""),
                                        after.value().value_or(""),
                                        before.value().value_or(""));
        if (merged.is_err()) return std::move(merged).error();
        VISTA_TRY(store_.write_file(snap.path, merged.value().content));

        if (merged.value().conflict) {
            vista::log::warn("restoring %s produced conflicts", snap.path.c_str());
            result.conflicted.push_back(snap.path);
        } else {
            result.restored.push_back(snap.path);
        }
    }

    pop(group_key);
    return Result<RestoreResult>::ok(std::move(result));
}

} // namespace vista
