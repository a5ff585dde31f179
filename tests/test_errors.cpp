// Tests for error classification.
#include "notemarker/errors.h"

#include <gtest/gtest.h>

#include <set>
#include <string>

namespace {

const notemarker::ErrorType kAllTypes[] = {
    notemarker::ErrorType::kConnectionRefused,   notemarker::ErrorType::kProToolsNotRunning,
    notemarker::ErrorType::kConnectionTimeout,   notemarker::ErrorType::kChannelFailure,
    notemarker::ErrorType::kGrpcError,           notemarker::ErrorType::kSdkVersionMismatch,
    notemarker::ErrorType::kHostNotReady,        notemarker::ErrorType::kPtslNotAvailable,
    notemarker::ErrorType::kPtslDisabled,        notemarker::ErrorType::kSessionIdParseError,
    notemarker::ErrorType::kUnsupportedCommand,  notemarker::ErrorType::kParsingError,
    notemarker::ErrorType::kUnknownError,
};

std::string ErrorPayload(const std::string& type, const std::string& message) {
  return R"({"errors":[{"command_error_type":")" + type +
         R"(","command_error_message":")" + message + R"("}]})";
}

}  // namespace

TEST(ErrorTaxonomyTest, EveryTypeHasNameAndUserAction) {
  std::set<std::string> names;
  for (auto type : kAllTypes) {
    const std::string name = notemarker::ErrorTypeName(type);
    EXPECT_FALSE(name.empty());
    EXPECT_TRUE(names.insert(name).second) << name;
    EXPECT_STRNE(notemarker::UserActionFor(type), "");
  }
  EXPECT_STREQ(notemarker::ErrorTypeName(notemarker::ErrorType::kHostNotReady),
               "PTSL_HOST_NOT_READY");
}

TEST(ErrorTaxonomyTest, RetryableTypes) {
  EXPECT_TRUE(notemarker::IsRetryable(notemarker::ErrorType::kConnectionRefused));
  EXPECT_TRUE(notemarker::IsRetryable(notemarker::ErrorType::kConnectionTimeout));
  EXPECT_TRUE(notemarker::IsRetryable(notemarker::ErrorType::kHostNotReady));
  EXPECT_FALSE(notemarker::IsRetryable(notemarker::ErrorType::kParsingError));
  EXPECT_FALSE(notemarker::IsRetryable(notemarker::ErrorType::kSdkVersionMismatch));

  const auto error = notemarker::MakeError(notemarker::ErrorType::kProToolsNotRunning, "down");
  EXPECT_TRUE(error.retryable);
  EXPECT_FALSE(error.user_action.empty());
}

TEST(CommandErrorTest, VocabularyMapsEveryEntry) {
  for (const auto& entry : notemarker::CommandErrorVocabulary()) {
    const auto by_name =
        notemarker::ClassifyCommandError(ErrorPayload(std::string("CEType_") + entry.name, "x"));
    EXPECT_EQ(by_name.type, entry.type) << entry.name;

    const auto found = notemarker::FindCommandError(std::to_string(entry.number));
    ASSERT_TRUE(found.has_value()) << entry.number;
    EXPECT_STREQ(found->name, entry.name);
  }
}

TEST(CommandErrorTest, HostNotReadyIsRetryable) {
  const auto error = notemarker::ClassifyCommandError(
      ErrorPayload("PT_HostNotReady", "still loading"), "Failed");
  EXPECT_EQ(error.type, notemarker::ErrorType::kHostNotReady);
  EXPECT_TRUE(error.retryable);
  EXPECT_NE(error.message.find("still loading"), std::string::npos);
}

TEST(CommandErrorTest, NumericTypeIsAccepted) {
  const auto error = notemarker::ClassifyCommandError(
      R"({"errors":[{"command_error_type":100,"command_error_message":"old host"}]})");
  EXPECT_EQ(error.type, notemarker::ErrorType::kSdkVersionMismatch);
}

TEST(CommandErrorTest, UnknownTypeIsUnknownError) {
  const auto error =
      notemarker::ClassifyCommandError(ErrorPayload("CEType_SomethingNew", "surprise"));
  EXPECT_EQ(error.type, notemarker::ErrorType::kUnknownError);
  EXPECT_EQ(error.context.at("command_error_type"), "CEType_SomethingNew");
}

TEST(CommandErrorTest, MalformedPayloadIsParsingError) {
  const auto error = notemarker::ClassifyCommandError("{not json", "Failed");
  EXPECT_EQ(error.type, notemarker::ErrorType::kParsingError);
}

TEST(CommandErrorTest, EmptyPayloadReportsStatus) {
  const auto error = notemarker::ClassifyCommandError("", "Canceled");
  EXPECT_EQ(error.type, notemarker::ErrorType::kUnknownError);
  EXPECT_NE(error.message.find("Canceled"), std::string::npos);

  const auto no_errors = notemarker::ClassifyCommandError(R"({"errors":[]})");
  EXPECT_EQ(no_errors.type, notemarker::ErrorType::kUnknownError);
}

TEST(TransportErrorTest, ClassifiesByStatusCode) {
  EXPECT_EQ(notemarker::ClassifyTransportError({14, "failed to connect to all addresses"}).type,
            notemarker::ErrorType::kProToolsNotRunning);
  EXPECT_EQ(notemarker::ClassifyTransportError({14, "Connection refused"}).type,
            notemarker::ErrorType::kConnectionRefused);
  EXPECT_EQ(notemarker::ClassifyTransportError({4, "Deadline Exceeded"}).type,
            notemarker::ErrorType::kConnectionTimeout);
  EXPECT_EQ(notemarker::ClassifyTransportError({7, "denied"}).type,
            notemarker::ErrorType::kPtslDisabled);
  EXPECT_EQ(notemarker::ClassifyTransportError({12, "no such method"}).type,
            notemarker::ErrorType::kSdkVersionMismatch);
}

TEST(TransportErrorTest, FallsBackToMessageText) {
  EXPECT_EQ(notemarker::ClassifyTransportError({2, "ECONNREFUSED"}).type,
            notemarker::ErrorType::kConnectionRefused);
  EXPECT_EQ(notemarker::ClassifyTransportError({2, "channel in TRANSIENT_FAILURE"}).type,
            notemarker::ErrorType::kChannelFailure);

  const auto other = notemarker::ClassifyTransportError({13, "internal"});
  EXPECT_EQ(other.type, notemarker::ErrorType::kGrpcError);
  EXPECT_EQ(other.context.at("grpc_code"), "13");
  EXPECT_EQ(notemarker::FormatError(other).rfind("GRPC_ERROR: ", 0), 0u);
}
