#include <gtest/gtest.h>

#include "TestDoubles.hpp"
#include "application/services/NotifyService.hpp"
#include "application/services/RequestComposer.hpp"
#include "domain/UserError.hpp"

using prowl::client::application::services::NotifyService;
using prowl::client::application::services::RequestComposer;
using prowl::client::domain::NotificationDraft;
using prowl::client::domain::RawInvocation;
using prowl::client::domain::UserError;

static const std::string kKey = "0123456789abcdef0123456789abcdef01234567";
static const std::string kStoredKey = "fedcba9876543210fedcba9876543210fedcba98";

struct NotifyServiceTest : ::testing::Test
{
  prowl_test::FakeStore store;
  prowl_test::FakeNotifier notifier;
  prowl_test::FakeIdentity identity;
  prowl_test::TestLogger log;
  NotifyService svc{store, notifier, identity, log};

  void run(const RawInvocation& in) { svc.run(RequestComposer{}.compose(in)); }
};

TEST_F(NotifyServiceTest, SetApiKeyWritesStoreOnly)
{
  RawInvocation in;
  in.setApiKey = kKey;
  run(in);

  EXPECT_EQ(store.sets, 1);
  EXPECT_EQ(store.values["default-api-key"], kKey);
  EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(NotifyServiceTest, SendUsesStoredKeyAndDefaultApplication)
{
  store.values["default-api-key"] = kStoredKey;

  RawInvocation in;
  in.positionals = {"deployed"};
  run(in);

  ASSERT_EQ(notifier.sent.size(), 1u);
  const auto& n = notifier.sent[0];
  EXPECT_EQ(n.apiKey, kStoredKey);
  EXPECT_EQ(n.application, "alice@buildbox");
  EXPECT_EQ(n.description, "deployed");
  EXPECT_FALSE(n.event.has_value());
  EXPECT_EQ(store.sets, 0);

  for (const auto& [name, value] : n.fields()) EXPECT_NE(name, "priority");
}

TEST_F(NotifyServiceTest, ExplicitKeyAndApplicationWin)
{
  store.values["default-api-key"] = kStoredKey;

  RawInvocation in;
  in.positionals = {"build", "0"};
  in.apiKey = kKey;
  in.application = "ci";
  in.priority = 2;
  run(in);

  ASSERT_EQ(notifier.sent.size(), 1u);
  const auto& n = notifier.sent[0];
  EXPECT_EQ(n.apiKey, kKey);
  EXPECT_EQ(n.application, "ci");
  EXPECT_EQ(n.event, "build");
  EXPECT_EQ(n.description, "0 ");
  EXPECT_EQ(n.priority, 2);
  EXPECT_EQ(store.gets, 0);
}

TEST_F(NotifyServiceTest, MissingKeyFailsBeforeSending)
{
  RawInvocation in;
  in.positionals = {"x"};

  EXPECT_THROW(run(in), UserError);
  EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(NotifyServiceTest, InvalidStoredKeyFailsBeforeSending)
{
  NotificationDraft d;
  d.description = "x";

  store.values["default-api-key"] = "not-a-key";
  EXPECT_THROW(svc.send(d), UserError);

  store.values["default-api-key"] = 42;
  EXPECT_THROW(svc.send(d), UserError);

  EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(NotifyServiceTest, ServerErrorCarriesBody)
{
  store.values["default-api-key"] = kStoredKey;
  notifier.reply = {401, "<error code=\"401\">Invalid API key</error>"};

  RawInvocation in;
  in.positionals = {"x"};

  try
  {
    run(in);
    FAIL() << "expected UserError";
  }
  catch (const UserError& e)
  {
    EXPECT_EQ(std::string(e.what()),
              "Error received from server: <error code=\"401\">Invalid API key</error>");
  }
  EXPECT_EQ(notifier.sent.size(), 1u);
}

TEST_F(NotifyServiceTest, PriorityOutOfRangeNeverReachesNetwork)
{
  store.values["default-api-key"] = kStoredKey;

  RawInvocation in;
  in.positionals = {"x"};
  in.priority = 3;

  EXPECT_THROW(run(in), UserError);
  EXPECT_TRUE(notifier.sent.empty());
  EXPECT_EQ(store.gets, 0);
}

TEST_F(NotifyServiceTest, ConflictingSetKeyTouchesNothing)
{
  RawInvocation in;
  in.setApiKey = kKey;
  in.url = "http://x";

  EXPECT_THROW(run(in), UserError);
  EXPECT_EQ(store.sets, 0);
  EXPECT_TRUE(notifier.sent.empty());
}
