// Tests for the whole startup sequence, with fake identity database and handoff

#include "tap_test.h"
#include "test_helpers.h"

#include <fmt/ranges.h>
#include <fmt/std.h>

#include "bootstrap.h"
#include "credentials.h"

namespace fs = std::filesystem;

namespace
{
    const std::string KEY_B64 = "b3RoZXIga2V5IG1hdGVyaWFsCg==";
    const std::string KEY = "other key material\n";

    settings::Settings makeSettings(const fs::path& base)
    {
        settings::Settings s;
        s.identity.uid = getuid();
        s.identity.gid = getgid();
        s.workdir = base / "workspace";
        s.project = "default";
        s.command = {"python", "server.py"};

        for(const auto& slot : credentials::KEY_SLOTS)
            s.keys.push_back({slot, {}});

        return s;
    }

    FakeDatabase makeDatabase(const fs::path& base)
    {
        FakeDatabase db;
        db.homeBase = base / "home";
        return db;
    }
}

int main()
{
    tap_test t;

    // Complete run on a fresh container
    {
        TempDir tmp;
        auto s = makeSettings(tmp.path());
        s.keys[2].encoded = KEY_B64;
        auto db = makeDatabase(tmp.path());
        FakeHandoff handoff;

        TAP_TEST_EQUAL(t, bootstrap::run(s, db, handoff), 0);
        TAP_TEST_EQUAL(t, handoff.calls, 1);
        TAP_TEST_EQUAL(t, handoff.lastArgv, s.command);
        TAP_TEST_EQUAL(t, handoff.lastIdentity.uid, getuid());
        TAP_TEST_EQUAL(t, handoff.lastIdentity.gid, getgid());
        TAP_TEST_EQUAL(t, handoff.lastIdentity.username, std::string{"mcp"});
        TAP_TEST_EQUAL(t, handoff.lastVariables, (handoff::Variables{{"WORKDIR", s.workdir.string()}}));

        TAP_TEST(t, fs::is_directory(s.workdir / "default"));

        // keys end up in the home of the created user
        fs::path sshDir = tmp.path() / "home" / "mcp" / ".ssh";
        TAP_TEST_EQUAL(t, modeOf(sshDir), 0700u);
        TAP_TEST_EQUAL(t, readFile(sshDir / "id_ed25519"), KEY);
        TAP_TEST_EQUAL(t, modeOf(sshDir / "id_ed25519"), 0600u);
        TAP_TEST(t, !fs::exists(sshDir / "id_rsa"));
        TAP_TEST(t, !fs::exists(sshDir / "id_ecdsa"));

        // Second boot with a different key value: nothing changes
        s.keys[2].encoded = "QUJD";
        s.keys[0].encoded = KEY_B64;
        FakeHandoff handoff2;
        TAP_TEST_EQUAL(t, bootstrap::run(s, db, handoff2), 0);
        TAP_TEST_EQUAL(t, handoff2.calls, 1);
        TAP_TEST_EQUAL(t, db.groupsCreated, 1);
        TAP_TEST_EQUAL(t, db.usersCreated, 1);
        TAP_TEST_EQUAL(t, readFile(sshDir / "id_ed25519"), KEY);
        TAP_TEST_EQUAL(t, readFile(sshDir / "id_rsa"), KEY);
        TAP_TEST_EQUAL(t, modeOf(sshDir), 0700u);
    }

    // Invalid base64 aborts before the handoff
    {
        TempDir tmp;
        auto s = makeSettings(tmp.path());
        s.keys[0].encoded = "this is not base64";
        auto db = makeDatabase(tmp.path());
        FakeHandoff handoff;

        TAP_TEST(t, bootstrap::run(s, db, handoff) != 0);
        TAP_TEST_EQUAL(t, handoff.calls, 0);
        TAP_TEST(t, !fs::exists(tmp.path() / "home" / "mcp" / ".ssh" / "id_rsa"));
    }

    // Identity failures abort before anything else happens
    {
        TempDir tmp;
        auto s = makeSettings(tmp.path());
        auto db = makeDatabase(tmp.path());
        db.failUserCreation = true;
        FakeHandoff handoff;

        TAP_TEST(t, bootstrap::run(s, db, handoff) != 0);
        TAP_TEST_EQUAL(t, handoff.calls, 0);
        TAP_TEST(t, !fs::exists(s.workdir));
    }

    // Unwritable existing workspace is only a warning
    {
        TempDir tmp;
        auto s = makeSettings(tmp.path());
        fs::create_directories(s.workdir / "default");
        chmod((s.workdir / "default").c_str(), 0555);

        auto db = makeDatabase(tmp.path());
        FakeHandoff handoff;

        // root can always write, pick someone else then
        if(geteuid() == 0)
        {
            s.identity.uid = 12345;
            s.identity.gid = 12345;
            s.sshDir = tmp.path() / "keys";
            s.keys.clear();
        }

        TAP_TEST_EQUAL(t, bootstrap::run(s, db, handoff), 0);
        TAP_TEST_EQUAL(t, handoff.calls, 1);
        TAP_TEST_EQUAL(t, modeOf(s.workdir / "default"), 0555u);
    }

    // Broken workspace is fatal
    {
        TempDir tmp;
        auto s = makeSettings(tmp.path());
        fs::create_directories(s.workdir);
        writeFile(s.workdir / "default", "file");
        auto db = makeDatabase(tmp.path());
        FakeHandoff handoff;

        TAP_TEST(t, bootstrap::run(s, db, handoff) != 0);
        TAP_TEST_EQUAL(t, handoff.calls, 0);
    }

    // Explicit SSH directory and HOME fallback
    {
        TempDir tmp;
        auto s = makeSettings(tmp.path());
        s.keys[1].encoded = KEY_B64;
        s.sshDir = tmp.path() / "explicit";
        auto db = makeDatabase(tmp.path());
        FakeHandoff handoff;

        TAP_TEST_EQUAL(t, bootstrap::run(s, db, handoff), 0);
        TAP_TEST_EQUAL(t, readFile(tmp.path() / "explicit" / "id_ecdsa"), KEY);

        TempDir tmp2;
        auto s2 = makeSettings(tmp2.path());
        s2.keys[1].encoded = KEY_B64;
        s2.home = tmp2.path() / "fallback";
        auto db2 = makeDatabase(tmp2.path());
        db2.groups[s2.identity.gid] = {"grp", s2.identity.gid};
        db2.users[s2.identity.uid] = {"nohome", s2.identity.uid, s2.identity.gid, {}, "/bin/sh"};
        FakeHandoff handoff2;

        TAP_TEST_EQUAL(t, bootstrap::run(s2, db2, handoff2), 0);
        TAP_TEST_EQUAL(t, readFile(tmp2.path() / "fallback" / ".ssh" / "id_ecdsa"), KEY);

        // no home anywhere
        TempDir tmp3;
        auto s3 = makeSettings(tmp3.path());
        auto db3 = makeDatabase(tmp3.path());
        db3.groups = db2.groups;
        db3.users = db2.users;
        FakeHandoff handoff3;

        TAP_TEST(t, bootstrap::run(s3, db3, handoff3) != 0);
        TAP_TEST_EQUAL(t, handoff3.calls, 0);
    }

    // Failing handoff is reported as failure
    {
        TempDir tmp;
        auto s = makeSettings(tmp.path());
        auto db = makeDatabase(tmp.path());
        FakeHandoff handoff;
        handoff.succeed = false;

        TAP_TEST(t, bootstrap::run(s, db, handoff) != 0);
        TAP_TEST_EQUAL(t, handoff.calls, 1);
    }

    return t.done();
}
