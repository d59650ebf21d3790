// Tests for group/user provisioning

#include "tap_test.h"
#include "test_helpers.h"

#include <fmt/std.h>

#include "identity.h"

using identity::Outcome;

int main()
{
    tap_test t;

    // Nothing there yet: group and user are created with the default names
    {
        FakeDatabase db;
        identity::Request request;
        request.uid = 2000;
        request.gid = 2000;

        auto result = identity::provision(db, request);
        TAP_TEST(t, result.ok());
        TAP_TEST(t, result.group == Outcome::Created);
        TAP_TEST(t, result.user == Outcome::Created);
        TAP_TEST_EQUAL(t, db.groupsCreated, 1);
        TAP_TEST_EQUAL(t, db.usersCreated, 1);

        TAP_TEST(t, db.groupByGID(2000).has_value());
        TAP_TEST(t, db.userByUID(2000).has_value());
        TAP_TEST_EQUAL(t, db.users[2000].gid, 2000u);
        TAP_TEST_EQUAL(t, db.users[2000].name, std::string{"mcp"});
        TAP_TEST_EQUAL(t, db.users[2000].shell, std::filesystem::path{"/bin/bash"});

        TAP_TEST_EQUAL(t, result.identity.uid, 2000u);
        TAP_TEST_EQUAL(t, result.identity.gid, 2000u);
        TAP_TEST_EQUAL(t, result.identity.username, std::string{"mcp"});
        TAP_TEST_EQUAL(t, result.identity.groupname, std::string{"mcp"});
        TAP_TEST_EQUAL(t, result.identity.home, std::filesystem::path{"/home/mcp"});

        // Second run is a no-op
        auto again = identity::provision(db, request);
        TAP_TEST(t, again.ok());
        TAP_TEST(t, again.group == Outcome::Existing);
        TAP_TEST(t, again.user == Outcome::Existing);
        TAP_TEST_EQUAL(t, db.groupsCreated, 1);
        TAP_TEST_EQUAL(t, db.usersCreated, 1);
        TAP_TEST_EQUAL(t, db.groups.size(), 1u);
        TAP_TEST_EQUAL(t, db.users.size(), 1u);
    }

    // Existing entries keep their names, whatever we asked for
    {
        FakeDatabase db;
        db.groups[1000] = {"staff", 1000};
        db.users[1000] = {"alice", 1000, 50, "/srv/alice", "/bin/sh"};

        identity::Request request;
        auto result = identity::provision(db, request);
        TAP_TEST(t, result.ok());
        TAP_TEST(t, result.group == Outcome::Existing);
        TAP_TEST(t, result.user == Outcome::Existing);
        TAP_TEST_EQUAL(t, db.groupsCreated, 0);
        TAP_TEST_EQUAL(t, db.usersCreated, 0);
        TAP_TEST_EQUAL(t, result.identity.groupname, std::string{"staff"});
        TAP_TEST_EQUAL(t, result.identity.username, std::string{"alice"});
        TAP_TEST_EQUAL(t, result.identity.home, std::filesystem::path{"/srv/alice"});

        // primary group of the existing user is not changed
        TAP_TEST_EQUAL(t, db.users[1000].gid, 50u);
    }

    // Group exists, user does not
    {
        FakeDatabase db;
        db.groups[3000] = {"builders", 3000};

        identity::Request request;
        request.uid = 3001;
        request.gid = 3000;
        request.userName = "worker";

        auto result = identity::provision(db, request);
        TAP_TEST(t, result.ok());
        TAP_TEST(t, result.group == Outcome::Existing);
        TAP_TEST(t, result.user == Outcome::Created);
        TAP_TEST_EQUAL(t, db.users[3001].gid, 3000u);
        TAP_TEST_EQUAL(t, result.identity.username, std::string{"worker"});
        TAP_TEST_EQUAL(t, result.identity.groupname, std::string{"builders"});
    }

    // Group creation failure aborts before touching users
    {
        FakeDatabase db;
        db.failGroupCreation = true;

        auto result = identity::provision(db, identity::Request{});
        TAP_TEST(t, !result.ok());
        TAP_TEST(t, result.group == Outcome::Failed);
        TAP_TEST_EQUAL(t, db.usersCreated, 0);
    }

    // User creation failure
    {
        FakeDatabase db;
        db.failUserCreation = true;

        auto result = identity::provision(db, identity::Request{});
        TAP_TEST(t, !result.ok());
        TAP_TEST(t, result.group == Outcome::Created);
        TAP_TEST(t, result.user == Outcome::Failed);
    }

    // The system database finds ourselves
    {
        identity::SystemDatabase db;
        auto me = db.userByUID(getuid());
        if(me)
        {
            TAP_TEST_EQUAL(t, me->uid, getuid());
            TAP_TEST(t, !me->name.empty());
        }
        else
            t.skip("current uid has no passwd entry");

        auto group = db.groupByGID(getgid());
        if(group)
            TAP_TEST_EQUAL(t, group->gid, getgid());
        else
            t.skip("current gid has no group entry");
    }

    return t.done();
}
