#pragma once

#include "DropItem.hpp"
#include "channel/MethodCall.hpp"

#include <vector>

namespace Drop::Channel {

auto encode_item(const DropItem &item) -> WireItem;
auto encode_items(const DropItems &items) -> std::vector<WireItem>;

/**
 * Items with data become memory-backed items with a fresh reserved path.
 *
 * @throws ProtocolException when an item carries neither path nor data.
 */
auto decode_item(const WireItem &wire) -> DropItem;
auto decode_items(const std::vector<WireItem> &wire) -> DropItems;

} // namespace Drop::Channel
