#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Solana address form of raw key bytes
std::string base58Encode(std::span<const uint8_t> bytes);

// nullopt on malformed input
std::optional<std::vector<uint8_t>> base64Decode(std::string_view encoded);
