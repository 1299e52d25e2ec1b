/**
 * @file AccessPolicyTest.cpp
 * @brief Unit-тесты Authorization Gate
 */

#include <gtest/gtest.h>
#include "domain/AccessPolicy.hpp"

using namespace invoicing::domain;

TEST(AccessPolicyTest, Reserve_WarehouseAndAdmin) {
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::WAREHOUSE, InvoiceAction::RESERVE, InvoiceStatus::WAREHOUSE_PENDING));
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::ADMIN, InvoiceAction::RESERVE, InvoiceStatus::WAREHOUSE_PENDING));
    EXPECT_FALSE(AccessPolicy::isAllowed(UserRole::ACCOUNTANT, InvoiceAction::RESERVE, InvoiceStatus::WAREHOUSE_PENDING));
}

TEST(AccessPolicyTest, Approve_AccountantAndAdmin) {
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::ACCOUNTANT, InvoiceAction::APPROVE, InvoiceStatus::ACCOUNTANT_PENDING));
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::ADMIN, InvoiceAction::APPROVE, InvoiceStatus::ACCOUNTANT_PENDING));
    EXPECT_FALSE(AccessPolicy::isAllowed(UserRole::WAREHOUSE, InvoiceAction::APPROVE, InvoiceStatus::ACCOUNTANT_PENDING));
}

TEST(AccessPolicyTest, ShipAndDeliver_WarehouseAndAdmin) {
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::WAREHOUSE, InvoiceAction::SHIP, InvoiceStatus::APPROVED));
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::WAREHOUSE, InvoiceAction::DELIVER, InvoiceStatus::SHIPPED));
    EXPECT_FALSE(AccessPolicy::isAllowed(UserRole::ACCOUNTANT, InvoiceAction::SHIP, InvoiceStatus::APPROVED));
    EXPECT_FALSE(AccessPolicy::isAllowed(UserRole::ACCOUNTANT, InvoiceAction::DELIVER, InvoiceStatus::SHIPPED));
}

TEST(AccessPolicyTest, Cancel_AccountantAndAdmin) {
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::ACCOUNTANT, InvoiceAction::CANCEL, InvoiceStatus::APPROVED));
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::ADMIN, InvoiceAction::CANCEL, InvoiceStatus::WAREHOUSE_PENDING));
    EXPECT_FALSE(AccessPolicy::isAllowed(UserRole::WAREHOUSE, InvoiceAction::CANCEL, InvoiceStatus::WAREHOUSE_PENDING));
}

TEST(AccessPolicyTest, CreateAndAdjust) {
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::ACCOUNTANT, InvoiceAction::CREATE));
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::ADMIN, InvoiceAction::CREATE));
    EXPECT_FALSE(AccessPolicy::isAllowed(UserRole::WAREHOUSE, InvoiceAction::CREATE));

    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::WAREHOUSE, InvoiceAction::ADJUST_STOCK));
    EXPECT_TRUE(AccessPolicy::isAllowed(UserRole::ADMIN, InvoiceAction::ADJUST_STOCK));
    EXPECT_FALSE(AccessPolicy::isAllowed(UserRole::ACCOUNTANT, InvoiceAction::ADJUST_STOCK));
}

// ============================================================================
// Видимость статусов
// ============================================================================

TEST(AccessPolicyTest, Warehouse_SeesOnlyOwnQueue) {
    auto visible = AccessPolicy::visibleStatuses(UserRole::WAREHOUSE);
    ASSERT_TRUE(visible.has_value());
    EXPECT_EQ(visible->size(), 3u);
    EXPECT_TRUE(AccessPolicy::canView(UserRole::WAREHOUSE, InvoiceStatus::WAREHOUSE_PENDING));
    EXPECT_TRUE(AccessPolicy::canView(UserRole::WAREHOUSE, InvoiceStatus::APPROVED));
    EXPECT_TRUE(AccessPolicy::canView(UserRole::WAREHOUSE, InvoiceStatus::SHIPPED));
    EXPECT_FALSE(AccessPolicy::canView(UserRole::WAREHOUSE, InvoiceStatus::ACCOUNTANT_PENDING));
    EXPECT_FALSE(AccessPolicy::canView(UserRole::WAREHOUSE, InvoiceStatus::DELIVERED));
    EXPECT_FALSE(AccessPolicy::canView(UserRole::WAREHOUSE, InvoiceStatus::CANCELLED));
}

TEST(AccessPolicyTest, AdminAndAccountant_SeeEverything) {
    EXPECT_FALSE(AccessPolicy::visibleStatuses(UserRole::ADMIN).has_value());
    for (auto status : allInvoiceStatuses()) {
        EXPECT_TRUE(AccessPolicy::canView(UserRole::ADMIN, status));
        EXPECT_TRUE(AccessPolicy::canView(UserRole::ACCOUNTANT, status));
    }
}

TEST(AccessPolicyTest, Warehouse_CannotActOnInvisibleInvoice) {
    // deliver разрешён складу по таблице, но delivered ему не виден
    EXPECT_FALSE(AccessPolicy::isAllowed(UserRole::WAREHOUSE, InvoiceAction::DELIVER, InvoiceStatus::DELIVERED));
}
