#include <faultline/common/errors.hpp>
#include <faultline/handlers/handlers.hpp>
#include <faultline/interceptor/exception.hpp>
#include <faultline/schema/tags.hpp>
#include <faultline/testing/common.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>

using namespace faultline::interceptor;
using namespace faultline::schema;
using faultline::dispatch::default_key;
using faultline::dispatch::handler_map_t;
using faultline::dispatch::handler_registry;
using faultline::hierarchy::tag_hierarchy;
using faultline::hierarchy::type_hierarchy;
using faultline::testing::make_request;
using faultline::testing::named_handler;

namespace {

context_t failed_with(fault_t error) {
  return context_t{.request = make_request(), .error = std::move(error)};
}

}  // namespace

TEST(exception_interceptor, is_named_and_only_handles_errors) {
  auto unit = exception_interceptor();
  EXPECT_EQ(unit.name, "faultline.interceptor/exception");
  EXPECT_FALSE(static_cast<bool>(unit.enter));
  EXPECT_FALSE(static_cast<bool>(unit.leave));
  EXPECT_TRUE(static_cast<bool>(unit.error));
}

TEST(exception_interceptor, response_replaces_error) {
  auto unit = exception_interceptor();
  auto context = unit.error(failed_with(make_error<std::runtime_error>("x")));

  ASSERT_TRUE(context.response.has_value());
  EXPECT_FALSE(context.error.has_value());
  EXPECT_FALSE(context.replaced);
  EXPECT_EQ(context.response->status, 500);
}

TEST(exception_interceptor, handler_error_replaces_error_and_clears_response) {
  auto tags = std::make_shared<tag_hierarchy>();
  auto config = std::make_shared<const configuration>(
      handler_registry{handler_map_t{
          {default_key, named_handler("default")},
          {tag_t{"app/retry"}, [](const fault_t&, const request_t&) {
             return outcome_t{make_error<std::logic_error>("replacement")};
           }}}},
      tags, type_hierarchy::standard());
  auto unit = exception_interceptor(config);

  auto context = failed_with(make_tagged_error("first", tag_t{"app/retry"}));
  context.response = response_t{.status = 200};
  context = unit.error(std::move(context));

  EXPECT_FALSE(context.response.has_value());
  ASSERT_TRUE(context.error.has_value());
  EXPECT_EQ(context.error->message, "replacement");
  EXPECT_TRUE(context.replaced);
}

TEST(exception_interceptor, context_without_error_is_unchanged) {
  auto config = default_configuration();
  auto context = context_t{.request = make_request(),
                           .response = response_t{.status = 204}};
  auto result = on_error(*config, context);
  ASSERT_TRUE(result.response.has_value());
  EXPECT_EQ(result.response->status, 204);
  EXPECT_FALSE(result.error.has_value());
}

TEST(exception_interceptor, tag_derived_from_registered_ancestor) {
  auto tags = std::make_shared<tag_hierarchy>();
  tags->derive(tag_t{"app/error"}, tag_t{"app/exception"});
  auto config = std::make_shared<const configuration>(
      handler_registry{handler_map_t{
          {default_key, faultline::handlers::default_handler},
          {tag_t{"app/exception"}, named_handler("exception", 409)}}},
      tags, type_hierarchy::standard());

  auto context = on_error(
      *config, failed_with(make_tagged_error("x", tag_t{"app/error"})));
  ASSERT_TRUE(context.response.has_value());
  EXPECT_EQ(context.response->status, 409);
}

TEST(exception_interceptor, logging_wrap_logs_once_per_dispatch) {
  auto out = std::ostringstream{};
  auto config = std::make_shared<const configuration>(
      handler_registry{faultline::handlers::default_handlers(),
                       faultline::handlers::make_log_to_console_wrap(
                           faultline::testing::make_stream_logger(out))},
      std::make_shared<tag_hierarchy>(), type_hierarchy::standard());

  auto context = on_error(*config, failed_with(make_tagged_error(
                                       "bad body", tags::decode_failure,
                                       decode_failure_t{.format = "edn"})));
  ASSERT_TRUE(context.response.has_value());
  EXPECT_EQ(context.response->status, 400);
  EXPECT_EQ(faultline::testing::lines_of(out.str()).size(), 1u);
}

TEST(configuration, missing_hierarchy_is_a_configuration_error) {
  EXPECT_THROW(
      (configuration{handler_registry{faultline::handlers::default_handlers()},
                     nullptr, type_hierarchy::standard()}),
      faultline::common::configuration_error);
}
