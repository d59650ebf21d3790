// SSH key material from base64-encoded environment variables

#include "credentials.h"

#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/std.h>

#include <sodium.h>

#include "log.h"
#include "os.h"
#include "scope_guard.h"

namespace fs = std::filesystem;

namespace credentials
{

std::optional<std::vector<unsigned char>> decodeBase64(std::string_view encoded)
{
    std::vector<unsigned char> bin(encoded.size() / 4 * 3 + 3);
    std::size_t binLength = 0;

    int ret = sodium_base642bin(
        bin.data(), bin.size(),
        encoded.data(), encoded.size(),
        "\r\n", &binLength, nullptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if(ret != 0 || binLength == 0)
    {
        sodium_memzero(bin.data(), bin.size());
        return {};
    }

    // Do not leave a copy of the key behind in the discarded tail
    sodium_memzero(bin.data() + binLength, bin.size() - binLength);
    bin.resize(binLength);
    return bin;
}

bool prepareDirectory(const std::filesystem::path& dir, const std::optional<identity::RuntimeIdentity>& owner)
{
    std::error_code ec;
    if(!fs::is_directory(dir, ec))
    {
        if(fs::exists(fs::symlink_status(dir, ec)))
        {
            error("{} exists, but is not a directory", dir);
            return false;
        }

        debug("Creating {}", dir);
        fs::create_directories(dir, ec);
        if(ec)
        {
            error("Could not create {}: {}", dir, ec.message());
            return false;
        }
    }

    // Always set permissions, even on an existing directory
    if(chmod(dir.c_str(), 0700) != 0)
    {
        sys_error("Could not chmod {}", dir);
        return false;
    }

    if(owner && chown(dir.c_str(), owner->uid, owner->gid) != 0)
    {
        sys_error("Could not chown {} to {}:{}", dir, owner->uid, owner->gid);
        return false;
    }

    return true;
}

Result materialize(const std::filesystem::path& dir, const KeyInput& input, const std::optional<identity::RuntimeIdentity>& owner)
{
    const auto& slot = input.slot;

    if(input.encoded.empty())
    {
        info("{} variable not defined, skipping", slot.label);
        return Result::SkippedUnset;
    }

    info("Found {} variable", slot.label);

    fs::path keyFile = dir / slot.fileName;

    std::error_code ec;
    auto status = fs::symlink_status(keyFile, ec);
    if(fs::exists(status))
    {
        if(!fs::is_regular_file(status))
            warning("{} exists, but is not a regular file. Leaving it alone.", keyFile);

        info("{} key file already exists", slot.label);
        return Result::SkippedExisting;
    }

    // Decode first, so that corrupt input never produces a file
    auto key = decodeBase64(input.encoded);
    if(!key)
    {
        error("Could not decode {} (invalid base64)", slot.variable);
        return Result::Failed;
    }
    auto wipe = sg::make_scope_guard([&]{ sodium_memzero(key->data(), key->size()); });

    info("Creating {} key file: {}", slot.label, keyFile);

    int fd = open(keyFile.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if(fd < 0)
    {
        if(errno == EEXIST)
        {
            info("{} key file already exists", slot.label);
            return Result::SkippedExisting;
        }

        sys_error("Could not create {}", keyFile);
        return Result::Failed;
    }

    bool complete = false;
    auto closeGuard = sg::make_scope_guard([&]{
        close(fd);
        if(!complete && unlink(keyFile.c_str()) != 0)
            sys_error("Could not remove incomplete key file {}", keyFile);
    });

    // umask might have removed bits, but we want exactly 0600
    if(fchmod(fd, 0600) != 0)
    {
        sys_error("Could not chmod {}", keyFile);
        return Result::Failed;
    }

    if(owner && fchown(fd, owner->uid, owner->gid) != 0)
    {
        sys_error("Could not chown {} to {}:{}", keyFile, owner->uid, owner->gid);
        return Result::Failed;
    }

    if(!os::write_to_fd(fd, *key))
    {
        error("Could not write {}", keyFile);
        return Result::Failed;
    }

    if(fsync(fd) != 0)
    {
        sys_error("Could not sync {}", keyFile);
        return Result::Failed;
    }

    complete = true;
    info("{} key file created successfully", slot.label);
    return Result::Created;
}

std::vector<Result> materializeAll(const std::filesystem::path& dir, const std::vector<KeyInput>& inputs, const std::optional<identity::RuntimeIdentity>& owner)
{
    std::vector<Result> results;

    if(!prepareDirectory(dir, owner))
    {
        results.push_back(Result::Failed);
        return results;
    }

    for(const auto& input : inputs)
    {
        results.push_back(materialize(dir, input, owner));
        if(results.back() == Result::Failed)
            return results;
    }

    info("SSH key setup completed");
    return results;
}

}
