#include <gtest/gtest.h>
#include <string>

#include "../core/Exception.hpp"

using namespace wordcube::core;

TEST(Errors, EachCodeRaisesItsOwnType)
{
    EXPECT_THROW(WCB_THROW(error::Code::Unknown, "x"), error::UnknownError);
    EXPECT_THROW(WCB_THROW(error::Code::Service, "x"), error::ServiceError);
    EXPECT_THROW(WCB_THROW(error::Code::Timeout, "x"), error::TimeoutError);
    EXPECT_THROW(WCB_THROW(error::Code::Network, "x"), error::NetworkError);
    EXPECT_THROW(WCB_THROW(error::Code::Storage, "x"), error::StorageError);
    EXPECT_THROW(WCB_ASSERT(1 + 1 == 3, "math"), error::AssertionError);
}

TEST(Errors, MessageAndCodeSurvive)
{
    try
    {
        WCB_THROW(error::Code::Storage, "disk full");
        FAIL() << "nothing thrown";
    }
    catch (error::StorageError const& e)
    {
        EXPECT_EQ(e.what(), std::string{"disk full"});
        EXPECT_EQ(e.data(), error::Code::Storage);
        EXPECT_EQ(error::to_string(e.data()), "Storage");
    }
}

TEST(Errors, TurnDataErrorsDescribeThemselves)
{
    EXPECT_EQ(error::describe(error::TurnDataError{error::TurnDataErrorCode::NoTurnDataYet, ""}), "No turn data yet");
    EXPECT_EQ(error::describe(error::TurnDataError{error::TurnDataErrorCode::MalformedTurnData, "bad root"}),
              "Malformed turn data | bad root");
}
