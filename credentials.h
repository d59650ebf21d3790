// SSH key material from base64-encoded environment variables

#ifndef CREDENTIALS_H
#define CREDENTIALS_H

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "identity.h"

namespace credentials
{

struct KeySlot
{
    std::string_view variable;  //!< environment variable carrying the base64 value
    std::string_view fileName;  //!< name inside the credentials directory
    std::string_view label;
};

constexpr auto KEY_SLOTS = std::to_array<KeySlot>({
    {"SSH_PRIVATE_KEY_RSA_B64",     "id_rsa",     "RSA"},
    {"SSH_PRIVATE_KEY_ECDSA_B64",   "id_ecdsa",   "ECDSA"},
    {"SSH_PRIVATE_KEY_ED25519_B64", "id_ed25519", "ED25519"},
});

//! A slot together with the value found for it (empty if unset)
struct KeyInput
{
    KeySlot slot;
    std::string encoded;
};

enum class Result
{
    Created,
    SkippedUnset,
    SkippedExisting,
    Failed
};

/**
 * Decode standard base64 (with padding). Line breaks are ignored, anything
 * else that is not part of the alphabet is an error. Empty results are
 * rejected as well.
 **/
[[nodiscard]]
std::optional<std::vector<unsigned char>> decodeBase64(std::string_view encoded);

/**
 * Create @p dir if needed and force its mode to 0700.
 * If @p owner is given, the directory is chowned to it.
 **/
[[nodiscard]]
bool prepareDirectory(const std::filesystem::path& dir, const std::optional<identity::RuntimeIdentity>& owner);

/**
 * Materialize a single key. An existing file is never overwritten, even if
 * the supplied value differs from its content.
 **/
[[nodiscard]]
Result materialize(const std::filesystem::path& dir, const KeyInput& input, const std::optional<identity::RuntimeIdentity>& owner);

/**
 * Prepare @p dir and materialize all @p inputs in order.
 * Stops at the first failure. Returns one result per processed slot.
 **/
[[nodiscard]]
std::vector<Result> materializeAll(const std::filesystem::path& dir, const std::vector<KeyInput>& inputs, const std::optional<identity::RuntimeIdentity>& owner);

}

#endif
