#pragma once

/**
 * @file loadout.hxx
 * @brief Encode/decode selection-tree loadout strings (version 2 layout)
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * =============================================================================
 * LAYOUT
 * =============================================================================
 *
 *   version        8 bits   must be 2
 *   treeIdentity  16 bits
 *   treeHash     128 bits   written as zero, skipped on read
 *   records        one per catalog node, ascending id:
 *
 *     selected            1 ─┐ 0 → next node
 *     purchased           1  │ 0 → next node (granted, rank 1)
 *     partial             1  │ 1 → rank follows
 *       rank              6  │
 *     has_choice          1  │ 1 → choice follows
 *       choice            2 ─┘
 *
 * The stream carries no lengths, so a single field sequence
 * (wire::transfer_record) drives both directions: the encoder runs it over a
 * WriteChannel, the decoder over a ReadChannel. Any change to the layout is
 * made there once.
 *
 * The string may end before the last catalog node; the decoder stops when no
 * bits remain and treats the rest as unselected.
 * =============================================================================
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../bitstream/bitstream.hxx"
#include "../catalog/catalog.hxx"
#include "../catalog/selection.hxx"

namespace talentcode {

namespace format {
inline constexpr std::uint32_t VERSION = 2;
inline constexpr unsigned int VERSION_BITS = 8;
inline constexpr unsigned int TREE_IDENTITY_BITS = 16;
inline constexpr unsigned int TREE_HASH_BITS = 128;
inline constexpr unsigned int RANK_BITS = 6;
inline constexpr unsigned int CHOICE_BITS = 2;
inline constexpr std::size_t HEADER_BITS = VERSION_BITS + TREE_IDENTITY_BITS + TREE_HASH_BITS;

inline constexpr std::uint32_t MAX_TREE_IDENTITY = (1U << TREE_IDENTITY_BITS) - 1;
inline constexpr int MAX_ENCODABLE_RANK = (1 << RANK_BITS) - 1;
inline constexpr int MAX_ENCODABLE_CHOICE = (1 << CHOICE_BITS) - 1;
}  // namespace format

// ── Errors ───────────────────────────────────────────────────────────────────

enum class decode_errc : int { invalid_character = 1, too_short = 2, unsupported_version = 3 };

inline auto decode_errc_name(decode_errc code) noexcept -> const char* {
    switch (code) {
        case decode_errc::invalid_character:
            return "InvalidCharacter";
        case decode_errc::too_short:
            return "TooShort";
        case decode_errc::unsupported_version:
            return "UnsupportedVersion";
    }
    return "Unknown";
}

/// Malformed loadout string. No partial result is ever produced.
class decode_error : public std::runtime_error {
   public:
    decode_error(decode_errc code, const std::string& message) : std::runtime_error(message), code_(code) {}

    [[nodiscard]] auto code() const noexcept -> decode_errc { return code_; }

   private:
    decode_errc code_;
};

/// Selection that cannot be expressed against the catalog or the field widths.
struct encode_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ── Decoded loadout ──────────────────────────────────────────────────────────

struct Loadout {
    std::uint32_t tree_identity = 0;
    Selection selections;

    auto operator==(const Loadout&) const -> bool = default;
};

// ── Field sequence ───────────────────────────────────────────────────────────

namespace wire {

/// One node's record as it appears on the wire.
struct Record {
    bool selected = false;
    bool purchased = false;
    bool partial = false;
    std::uint32_t rank = 0;
    bool has_choice = false;
    std::uint32_t choice = 0;
};

class WriteChannel {
   public:
    explicit WriteChannel(BitWriter& writer) : writer_(writer) {}

    void flag(bool& value) { writer_.write(1, value ? 1U : 0U); }
    void field(unsigned int bits, std::uint32_t& value) { writer_.write(bits, value); }
    void reserved(std::size_t bits) { writer_.write_zeros(bits); }

   private:
    BitWriter& writer_;
};

class ReadChannel {
   public:
    explicit ReadChannel(BitReader& reader) : reader_(reader) {}

    void flag(bool& value) { value = reader_.read(1) != 0; }
    void field(unsigned int bits, std::uint32_t& value) { value = static_cast<std::uint32_t>(reader_.read(bits)); }
    void reserved(std::size_t bits) { reader_.skip(bits); }

   private:
    BitReader& reader_;
};

template <typename Channel>
void transfer_version(Channel& channel, std::uint32_t& version) {
    channel.field(format::VERSION_BITS, version);
}

/// Everything after the version field, version 2.
template <typename Channel>
void transfer_header_v2(Channel& channel, std::uint32_t& tree_identity) {
    channel.field(format::TREE_IDENTITY_BITS, tree_identity);
    channel.reserved(format::TREE_HASH_BITS);
}

template <typename Channel>
void transfer_record(Channel& channel, Record& rec) {
    channel.flag(rec.selected);
    if (!rec.selected) {
        return;
    }
    channel.flag(rec.purchased);
    if (!rec.purchased) {
        return;
    }
    channel.flag(rec.partial);
    if (rec.partial) {
        channel.field(format::RANK_BITS, rec.rank);
    }
    channel.flag(rec.has_choice);
    if (rec.has_choice) {
        channel.field(format::CHOICE_BITS, rec.choice);
    }
}

/// Record the encoder writes for `node` given its pick (nullptr = not selected).
inline auto record_for(const Node& node, const Pick* pick, std::optional<std::uint32_t> tree_identity) -> Record {
    Record rec;
    if (pick == nullptr) {
        return rec;
    }
    rec.selected = true;
    rec.purchased = pick->rank > node.baseline_rank(tree_identity);
    if (!rec.purchased) {
        return rec;
    }
    rec.partial = pick->rank != node.max_rank;
    rec.rank = rec.partial ? static_cast<std::uint32_t>(pick->rank) : 0U;
    rec.has_choice = node.has_choice();
    rec.choice = rec.has_choice ? static_cast<std::uint32_t>(pick->choice_index.value_or(0)) : 0U;
    return rec;
}

/// Pick the decoder reconstructs from a selected record.
inline auto pick_from(const Node& node, const Record& rec) -> Pick {
    Pick pick;
    if (!rec.purchased) {
        pick.rank = 1;
        return pick;
    }
    pick.rank = rec.partial ? static_cast<int>(rec.rank) : node.max_rank;
    if (rec.has_choice) {
        pick.choice_index = static_cast<int>(rec.choice);
    }
    return pick;
}

}  // namespace wire

// ── Encoder ──────────────────────────────────────────────────────────────────

namespace loadout_detail {

inline void check_encodable(std::uint32_t tree_identity, const Catalog& catalog, const Selection& selections) {
    if (tree_identity > format::MAX_TREE_IDENTITY) {
        throw encode_error("tree identity " + std::to_string(tree_identity) + " does not fit in 16 bits");
    }
    for (const auto& [id, pick] : selections) {
        const Node* node = catalog.find(id);
        const std::string where = "node " + std::to_string(id);
        if (node == nullptr) {
            throw encode_error(where + " is not in the catalog");
        }
        if (pick.rank < 1 || pick.rank > node->max_rank || pick.rank > format::MAX_ENCODABLE_RANK) {
            throw encode_error(where + ": rank " + std::to_string(pick.rank) + " outside 1.." + std::to_string(node->max_rank));
        }
        if (!pick.choice_index) {
            continue;
        }
        if (!node->has_choice()) {
            throw encode_error(where + " takes no choice index");
        }
        if (pick.rank <= node->baseline_rank(tree_identity)) {
            throw encode_error(where + " is at its granted baseline; a choice index cannot be written");
        }
        const int choice = *pick.choice_index;
        const auto count = static_cast<int>(node->entries().size());
        if (choice < 0 || choice >= count || choice > format::MAX_ENCODABLE_CHOICE) {
            throw encode_error(where + ": choice index " + std::to_string(choice) + " outside its " + std::to_string(count) + " entries");
        }
    }
}

}  // namespace loadout_detail

/**
 * @brief Serialize `selections` against `catalog` into a loadout string.
 *
 * Deterministic: identical inputs give identical strings. Every catalog
 * node gets a record, so the string is never trimmed.
 *
 * @throws encode_error if the selection names a node outside the catalog,
 *         has a rank or choice the node (or field width) cannot hold, or the
 *         tree identity exceeds 16 bits.
 */
inline auto encode(std::uint32_t tree_identity, const Catalog& catalog, const Selection& selections) -> std::string {
    loadout_detail::check_encodable(tree_identity, catalog, selections);

    BitWriter writer;
    wire::WriteChannel channel(writer);

    std::uint32_t version = format::VERSION;
    wire::transfer_version(channel, version);
    wire::transfer_header_v2(channel, tree_identity);

    for (const auto& node : catalog.nodes()) {
        auto it = selections.find(node.id);
        wire::Record rec = wire::record_for(node, it == selections.end() ? nullptr : &it->second, tree_identity);
        wire::transfer_record(channel, rec);
    }
    return writer.flush();
}

inline auto encode(const Loadout& loadout, const Catalog& catalog) -> std::string { return encode(loadout.tree_identity, catalog, loadout.selections); }

// ── Decoder ──────────────────────────────────────────────────────────────────

namespace loadout_detail {

inline void check_decodable(std::string_view text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!is_symbol(text[i])) {
            throw decode_error(decode_errc::invalid_character,
                               std::string("invalid character '") + text[i] + "' at position " + std::to_string(i) + " in loadout string");
        }
    }
    const std::size_t bits = text.size() * bitstream_detail::SYMBOL_BITS;
    if (bits < format::HEADER_BITS) {
        throw decode_error(decode_errc::too_short,
                           "loadout string too short: " + std::to_string(bits) + " bits, header needs " + std::to_string(format::HEADER_BITS));
    }
}

inline auto decode_v2(BitReader& reader, const Catalog& catalog) -> Loadout {
    wire::ReadChannel channel(reader);
    Loadout loadout;
    wire::transfer_header_v2(channel, loadout.tree_identity);

    for (const auto& node : catalog.nodes()) {
        if (reader.bits_remaining() < 1) {
            break;
        }
        wire::Record rec;
        wire::transfer_record(channel, rec);
        if (rec.selected) {
            loadout.selections.emplace(node.id, wire::pick_from(node, rec));
        }
    }
    return loadout;
}

}  // namespace loadout_detail

/**
 * @brief Parse a loadout string against `catalog`.
 *
 * The version is always read first and the rest of the stream is decoded
 * by the layout registered for it; only version 2 exists today.
 *
 * @throws decode_error with code invalid_character, too_short or
 *         unsupported_version.
 */
inline auto decode(std::string_view text, const Catalog& catalog) -> Loadout {
    loadout_detail::check_decodable(text);

    BitReader reader(text);
    wire::ReadChannel channel(reader);
    std::uint32_t version = 0;
    wire::transfer_version(channel, version);

    switch (version) {
        case format::VERSION:
            return loadout_detail::decode_v2(reader, catalog);
        default:
            throw decode_error(decode_errc::unsupported_version, "unsupported serialization version " + std::to_string(version));
    }
}

}  // namespace talentcode
