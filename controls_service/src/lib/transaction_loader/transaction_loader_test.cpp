#include "transaction_loader/transaction_loader.hpp"

#include <userver/fs/blocking/temp_directory.hpp>
#include <userver/utest/utest.hpp>

#include "rule_utils/errors.hpp"
#include "test_utils/test_utils.hpp"

namespace payment_controls {

using test_utils::BatchFromCsv;
using test_utils::BatchFromRows;

TEST(TransactionLoader, FillsTypedFieldsPerRail) {
    const auto batch = BatchFromRows(
        "A1,ACH,2024-03-01T10:00:00,U1,6000.5,False,12,instant,,,,,,\n"
        "C1,CARD,2024-03-01T10:01:00,U2,250,True,,,,False,5967.0,true,,\n"
        "W1,CRYPTO,2024-03-01T10:02:00,U3,15000,false,,,,,,,2,1\n");

    ASSERT_EQ(batch.Size(), 3u);
    const auto& ach = batch.Transactions()[0];
    EXPECT_EQ(ach.tx_id(), "A1");
    EXPECT_DOUBLE_EQ(ach.amount(), 6000.5);
    EXPECT_FALSE(ach.is_fraud_pattern());
    EXPECT_EQ(ach.account_age_days(), 12);
    EXPECT_EQ(ach.funding_speed(), "instant");
    EXPECT_FALSE(ach.has_return_code());
    EXPECT_FALSE(ach.has_mcc());

    const auto& card = batch.Transactions()[1];
    EXPECT_TRUE(card.is_fraud_pattern());
    ASSERT_TRUE(card.has_card_present());
    EXPECT_FALSE(card.card_present());
    EXPECT_EQ(card.mcc(), 5967);
    EXPECT_TRUE(card.is_new_device());

    const auto& crypto = batch.Transactions()[2];
    EXPECT_EQ(crypto.wallet_age_days(), 2);
    EXPECT_TRUE(crypto.to_is_high_risk());
    EXPECT_TRUE(crypto.attributes().empty());
}

TEST(TransactionLoader, KeepsUntypedAndUnparsableCellsAsAttributes) {
    const auto batch = BatchFromCsv(
        "tx_id,rail,timestamp,user_id,amount,is_fraud_pattern,mcc,channel\n"
        "T1,CARD,2024-01-01,U1,10,False,unknown,web\n");

    const auto& tx = batch.Transactions()[0];
    EXPECT_FALSE(tx.has_mcc());
    EXPECT_EQ(tx.attributes().at("mcc"), "unknown");
    EXPECT_EQ(tx.attributes().at("channel"), "web");
    EXPECT_TRUE(batch.HasColumn("channel"));
    EXPECT_FALSE(batch.HasColumn("country"));
}

TEST(TransactionLoader, IndexesRowsByRailAndId) {
    const auto batch = BatchFromRows(
        "A1,ACH,t,U1,1,False,,,,,,,,\n"
        "C1,CARD,t,U1,1,False,,,,,,,,\n"
        "A2,ACH,t,U1,1,False,,,,,,,,\n"
        "X1,WIRE,t,U1,1,False,,,,,,,,\n");

    EXPECT_EQ(batch.RowsForRail("ACH"), (std::vector<std::size_t>{0, 2}));
    EXPECT_EQ(batch.RowsForRail("WIRE"), (std::vector<std::size_t>{3}));
    EXPECT_TRUE(batch.RowsForRail("CRYPTO").empty());
    ASSERT_NE(batch.Find("C1", "CARD"), nullptr);
    EXPECT_EQ(batch.Find("C1", "ACH"), nullptr);
    EXPECT_EQ(batch.Find("Z9", "ACH"), nullptr);
}

TEST(TransactionLoader, HeaderOnlyIsAnEmptyBatch) {
    const auto batch = BatchFromRows("");
    EXPECT_TRUE(batch.Empty());
    EXPECT_TRUE(batch.HasColumn("is_fraud_pattern"));
}

TEST(TransactionLoader, MissingRequiredColumn) {
    try {
        BatchFromCsv("tx_id,rail,timestamp,user_id,amount\nT1,ACH,t,U1,1\n");
        FAIL() << "expected MissingInputError";
    } catch (const MissingInputError& e) {
        EXPECT_NE(std::string(e.what()).find("is_fraud_pattern"), std::string::npos);
    }
}

TEST(TransactionLoader, RejectsBadRecords) {
    const std::string header = "tx_id,rail,timestamp,user_id,amount,is_fraud_pattern\n";
    EXPECT_THROW(BatchFromCsv(header + "T1,ACH,t,U1,,False\n"), InvalidInputError);
    EXPECT_THROW(BatchFromCsv(header + "T1,ACH,t,U1,lots,False\n"), InvalidInputError);
    EXPECT_THROW(BatchFromCsv(header + "T1,ACH,t,U1,1,maybe\n"), InvalidInputError);
    EXPECT_THROW(BatchFromCsv(header + "T1,ACH,t,U1,1\n"), InvalidInputError);
    EXPECT_THROW(BatchFromCsv(header + "T1,ACH,t,U1,1,False\nT1,CARD,t,U2,2,False\n"),
                 InvalidInputError);
    EXPECT_THROW(BatchFromCsv("tx_id,rail,timestamp,user_id,amount,is_fraud_pattern,amount\n"),
                 InvalidInputError);
}

TEST(TransactionLoader, LoadsFromFile) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    const auto path = dir.GetPath() + "/transactions.csv";
    test_utils::WriteTextFile(path,
                              "tx_id,rail,timestamp,user_id,amount,is_fraud_pattern\n"
                              "T1,ACH,t,U1,1,False\n");

    EXPECT_EQ(LoadTransactions(path).Size(), 1u);
    EXPECT_THROW(LoadTransactions(dir.GetPath() + "/absent.csv"), MissingInputError);
}

}  // namespace payment_controls
