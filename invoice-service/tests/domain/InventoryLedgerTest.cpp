/**
 * @file InventoryLedgerTest.cpp
 * @brief Unit-тесты расчётов по журналу склада
 */

#include <gtest/gtest.h>
#include "domain/InventoryLedger.hpp"

using namespace invoicing::domain;

namespace {

InventoryTransaction entry(const std::string& productId, const std::string& invoiceId,
                           TransactionKind kind, int64_t delta) {
    InventoryTransaction t;
    t.id = "txn-" + productId + "-" + std::to_string(delta);
    t.productId = productId;
    t.invoiceId = invoiceId;
    t.kind = kind;
    t.delta = delta;
    return t;
}

} // namespace

TEST(InventoryLedgerTest, NetDelta_SumsPerProduct) {
    InventoryLedger ledger({
        entry("p-1", "inv-1", TransactionKind::RESERVE, -8),
        entry("p-2", "inv-1", TransactionKind::RESERVE, -3),
        entry("p-1", "", TransactionKind::ADJUST, 5),
        entry("p-1", "inv-1", TransactionKind::SHIP_MARK, 0)});

    EXPECT_EQ(ledger.netDelta("p-1"), -3);
    EXPECT_EQ(ledger.netDelta("p-2"), -3);
    EXPECT_EQ(ledger.netDelta("p-3"), 0);
}

TEST(InventoryLedgerTest, OpenReservations_ReserveMinusRelease) {
    InventoryLedger ledger;
    ledger.append(entry("p-1", "inv-1", TransactionKind::RESERVE, -8));
    ledger.append(entry("p-2", "inv-1", TransactionKind::RESERVE, -3));
    ledger.append(entry("p-1", "inv-2", TransactionKind::RESERVE, -1));

    auto open = ledger.openReservations("inv-1");
    ASSERT_EQ(open.size(), 2u);
    EXPECT_EQ(open["p-1"], 8);
    EXPECT_EQ(open["p-2"], 3);
    EXPECT_TRUE(ledger.hasOpenReservation("inv-1"));

    ledger.append(entry("p-1", "inv-1", TransactionKind::RELEASE, 8));
    ledger.append(entry("p-2", "inv-1", TransactionKind::RELEASE, 3));
    EXPECT_TRUE(ledger.openReservations("inv-1").empty());
    EXPECT_FALSE(ledger.hasOpenReservation("inv-1"));
    EXPECT_TRUE(ledger.hasOpenReservation("inv-2"));
}

TEST(InventoryLedgerTest, ShipMark_DoesNotCloseReservation) {
    InventoryLedger ledger({
        entry("p-1", "inv-1", TransactionKind::RESERVE, -4),
        entry("p-1", "inv-1", TransactionKind::SHIP_MARK, 0)});

    EXPECT_EQ(ledger.openReservations("inv-1").at("p-1"), 4);
    EXPECT_EQ(ledger.reservedQuantity("p-1"), 4);
}

TEST(InventoryLedgerTest, ReservedQuantity_AcrossInvoices) {
    InventoryLedger ledger({
        entry("p-1", "inv-1", TransactionKind::RESERVE, -4),
        entry("p-1", "inv-2", TransactionKind::RESERVE, -6),
        entry("p-1", "inv-2", TransactionKind::RELEASE, 6),
        entry("p-1", "", TransactionKind::ADJUST, -2)});

    EXPECT_EQ(ledger.reservedQuantity("p-1"), 4);
}

TEST(InventoryLedgerTest, Reconciles_BaselinePlusDeltaEqualsCurrent) {
    InventoryLedger ledger({
        entry("p-1", "inv-1", TransactionKind::RESERVE, -8),
        entry("p-1", "inv-1", TransactionKind::RELEASE, 8),
        entry("p-1", "", TransactionKind::ADJUST, 2)});

    EXPECT_TRUE(ledger.reconciles("p-1", 10, 12));
    EXPECT_FALSE(ledger.reconciles("p-1", 10, 10));
}
