/**
 * @file InvoiceServiceTest.cpp
 * @brief Unit-тесты жизненного цикла счёта поверх in-memory хранилища
 */

#include <gtest/gtest.h>
#include "../mocks/InMemoryWorld.hpp"
#include <limits>

using namespace invoicing;
using namespace invoicing::tests;

class InvoiceServiceTest : public ::testing::Test {
protected:
    InMemoryWorld world_;

    domain::InvoiceView createAndReserve(const std::vector<std::pair<std::string, int64_t>>& lines) {
        auto view = world_.createInvoice(lines);
        return world_.invoices->reserve(world_.warehouse, view.invoice.id);
    }

    std::vector<domain::InventoryTransaction> ledgerOf(const std::string& invoiceId) {
        domain::TransactionFilter filter;
        filter.invoiceId = invoiceId;
        filter.limit = 1000;
        return world_.inventory->listTransactions(world_.admin, filter);
    }
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(InvoiceServiceTest, Create_StartsInWarehousePending) {
    world_.addProduct("p-1", 10);

    auto view = world_.createInvoice({{"p-1", 4}});

    EXPECT_EQ(view.invoice.status, domain::InvoiceStatus::WAREHOUSE_PENDING);
    EXPECT_FALSE(view.invoice.id.empty());
    EXPECT_EQ(view.invoice.number.rfind("INV-", 0), 0u);
    EXPECT_EQ(view.invoice.createdBy, "u-acc");
    EXPECT_EQ(view.customer.fullName(), "Reza Karimi");
    ASSERT_EQ(view.customer.bankAccounts.size(), 1u);
    EXPECT_EQ(view.creator.email, "acc@shop.ir");
    ASSERT_EQ(view.items.size(), 1u);
    EXPECT_EQ(view.items[0].product.name, "Fabric p-1");
    EXPECT_EQ(view.invoice.total(), domain::Money(600000, 0));

    // создание не трогает склад
    EXPECT_EQ(world_.stockOf("p-1"), 10);
    EXPECT_TRUE(ledgerOf(view.invoice.id).empty());
}

TEST_F(InvoiceServiceTest, Create_NumbersAreSequential) {
    world_.addProduct("p-1", 10);

    auto first = world_.createInvoice({{"p-1", 1}});
    auto second = world_.createInvoice({{"p-1", 1}});

    int year = domain::Invoice::numberingYear(first.invoice.createdAt);
    EXPECT_EQ(first.invoice.number, domain::Invoice::formatNumber(year, 1));
    EXPECT_EQ(second.invoice.number, domain::Invoice::formatNumber(year, 2));
}

TEST_F(InvoiceServiceTest, Create_RollsTimesPieces) {
    world_.addProduct("p-1", 100);
    auto request = InMemoryWorld::requestFor({{"p-1", 0}});
    request.items[0].rollsCount = 3;
    request.items[0].piecesPerRoll = 12;

    auto view = world_.invoices->createInvoice(world_.accountant, request);

    EXPECT_EQ(view.invoice.items()[0].quantity, 36);
}

TEST_F(InvoiceServiceTest, Create_WarehouseIsForbidden) {
    world_.addProduct("p-1", 10);
    EXPECT_THROW(
        world_.invoices->createInvoice(world_.warehouse, InMemoryWorld::requestFor({{"p-1", 1}})),
        domain::ForbiddenException);
}

TEST_F(InvoiceServiceTest, Create_ValidationErrors) {
    world_.addProduct("p-1", 10);

    auto empty = InMemoryWorld::requestFor({});
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, empty), domain::ValidationException);

    auto zero = InMemoryWorld::requestFor({{"p-1", 0}});
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, zero), domain::ValidationException);

    auto negativePrice = InMemoryWorld::requestFor({{"p-1", 1}});
    negativePrice.items[0].unitPrice = domain::Money(-5, 0);
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, negativePrice), domain::ValidationException);

    auto rollsOnly = InMemoryWorld::requestFor({{"p-1", 0}});
    rollsOnly.items[0].rollsCount = 2;
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, rollsOnly), domain::ValidationException);

    auto noCustomer = InMemoryWorld::requestFor({{"p-1", 1}});
    noCustomer.customerId.clear();
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, noCustomer), domain::ValidationException);

    // произведение двух отрицательных положительно, но такой ввод не имеет смысла
    auto negativeRolls = InMemoryWorld::requestFor({{"p-1", 0}});
    negativeRolls.items[0].rollsCount = -2;
    negativeRolls.items[0].piecesPerRoll = -5;
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, negativeRolls), domain::ValidationException);

    auto zeroPieces = InMemoryWorld::requestFor({{"p-1", 5}});
    zeroPieces.items[0].rollsCount = 2;
    zeroPieces.items[0].piecesPerRoll = 0;
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, zeroPieces), domain::ValidationException);

    EXPECT_EQ(world_.stockOf("p-1"), 10);
}

TEST_F(InvoiceServiceTest, Create_RollsOverflow_Rejected) {
    world_.addProduct("p-1", 10);

    auto request = InMemoryWorld::requestFor({{"p-1", 0}});
    request.items[0].rollsCount = std::numeric_limits<int64_t>::max() / 2 + 1;
    request.items[0].piecesPerRoll = 2;
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, request), domain::ValidationException);

    auto pieces = InMemoryWorld::requestFor({{"p-1", 0}});
    pieces.items[0].detailedRolls = {{{std::numeric_limits<int64_t>::max(), 1}}};
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, pieces), domain::ValidationException);
}

TEST_F(InvoiceServiceTest, Create_DetailedRolls_SumPiecesAndWinOverRollsCount) {
    world_.addProduct("p-1", 100);
    auto request = InMemoryWorld::requestFor({{"p-1", 1}});
    request.items[0].rollsCount = 10;
    request.items[0].piecesPerRoll = 10;
    request.items[0].detailedRolls = {{{12, 8}}, {{15}}};

    auto view = world_.invoices->createInvoice(world_.accountant, request);

    const auto& item = view.invoice.items()[0];
    EXPECT_EQ(item.quantity, 35);
    ASSERT_EQ(item.detailedRolls.size(), 2u);
    EXPECT_EQ(item.detailedRolls[0].pieces, (std::vector<int64_t>{12, 8}));

    auto reserved = world_.invoices->reserve(world_.warehouse, view.invoice.id);
    EXPECT_EQ(reserved.invoice.status, domain::InvoiceStatus::ACCOUNTANT_PENDING);
    EXPECT_EQ(world_.stockOf("p-1"), 65);
}

TEST_F(InvoiceServiceTest, Create_DetailedRolls_NonPositivePiece_Rejected) {
    world_.addProduct("p-1", 100);
    auto request = InMemoryWorld::requestFor({{"p-1", 1}});
    request.items[0].detailedRolls = {{{12, 0}}};

    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, request), domain::ValidationException);
}

TEST_F(InvoiceServiceTest, Create_UnavailableProduct_Rejected) {
    domain::Product product;
    product.id = "p-off";
    product.name = "Discontinued velvet";
    product.unit = "meter";
    product.quantityAvailable = 50;
    product.isAvailable = false;
    world_.store->addProduct(product);

    EXPECT_THROW(
        world_.invoices->createInvoice(world_.admin, InMemoryWorld::requestFor({{"p-off", 1}})),
        domain::ValidationException);
}

TEST_F(InvoiceServiceTest, Create_UnknownReferences_NotFound) {
    world_.addProduct("p-1", 10);

    auto unknownProduct = InMemoryWorld::requestFor({{"p-404", 1}});
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, unknownProduct), domain::NotFoundException);

    auto unknownCustomer = InMemoryWorld::requestFor({{"p-1", 1}});
    unknownCustomer.customerId = "c-404";
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, unknownCustomer), domain::NotFoundException);
}

TEST_F(InvoiceServiceTest, Create_MixedPaymentRequiresBreakdown) {
    world_.addProduct("p-1", 10);

    auto mixed = InMemoryWorld::requestFor({{"p-1", 1}});
    mixed.paymentType = domain::PaymentType::MIXED;
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, mixed), domain::ValidationException);

    mixed.paymentBreakdown["wire"] = domain::Money(100, 0);
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, mixed), domain::ValidationException);

    mixed.paymentBreakdown.clear();
    mixed.paymentBreakdown["cash"] = domain::Money(100000, 0);
    mixed.paymentBreakdown["check"] = domain::Money(50000, 0);
    auto view = world_.invoices->createInvoice(world_.admin, mixed);
    EXPECT_EQ(view.invoice.paymentBreakdown.size(), 2u);

    auto cash = InMemoryWorld::requestFor({{"p-1", 1}});
    cash.paymentBreakdown["cash"] = domain::Money(1, 0);
    EXPECT_THROW(world_.invoices->createInvoice(world_.admin, cash), domain::ValidationException);
}

// ============================================================================
// RESERVE
// ============================================================================

TEST_F(InvoiceServiceTest, Reserve_DeductsStockAndWritesLedger) {
    world_.addProduct("p-1", 10);
    world_.addProduct("p-2", 5);

    auto view = createAndReserve({{"p-1", 8}, {"p-2", 5}});

    EXPECT_EQ(view.invoice.status, domain::InvoiceStatus::ACCOUNTANT_PENDING);
    EXPECT_EQ(world_.stockOf("p-1"), 2);
    EXPECT_EQ(world_.stockOf("p-2"), 0);

    auto ledger = ledgerOf(view.invoice.id);
    ASSERT_EQ(ledger.size(), 2u);
    for (const auto& txn : ledger) {
        EXPECT_EQ(txn.kind, domain::TransactionKind::RESERVE);
        EXPECT_EQ(txn.createdBy, "u-wh");
        EXPECT_LT(txn.delta, 0);
    }
}

TEST_F(InvoiceServiceTest, Reserve_IsAllOrNothing) {
    world_.addProduct("A", 10);
    world_.addProduct("B", 2);
    auto view = world_.createInvoice({{"A", 5}, {"B", 3}});

    try {
        world_.invoices->reserve(world_.warehouse, view.invoice.id);
        FAIL() << "expected InsufficientStockException";
    } catch (const domain::InsufficientStockException& e) {
        ASSERT_EQ(e.shortfalls().size(), 1u);
        EXPECT_EQ(e.shortfalls()[0].productId, "B");
        EXPECT_EQ(e.shortfalls()[0].shortfall(), 1);
    }

    EXPECT_EQ(world_.stockOf("A"), 10);
    EXPECT_EQ(world_.stockOf("B"), 2);
    EXPECT_TRUE(ledgerOf(view.invoice.id).empty());
    EXPECT_EQ(world_.invoices->getInvoice(world_.admin, view.invoice.id).invoice.status,
              domain::InvoiceStatus::WAREHOUSE_PENDING);
}

TEST_F(InvoiceServiceTest, Reserve_ListsEveryShortProduct) {
    world_.addProduct("A", 1);
    world_.addProduct("B", 1);
    auto view = world_.createInvoice({{"A", 2}, {"B", 4}});

    try {
        world_.invoices->reserve(world_.admin, view.invoice.id);
        FAIL() << "expected InsufficientStockException";
    } catch (const domain::InsufficientStockException& e) {
        EXPECT_EQ(e.shortfalls().size(), 2u);
    }
}

TEST_F(InvoiceServiceTest, Reserve_SameProductOnTwoLines_CheckedTogether) {
    world_.addProduct("p-1", 10);
    auto view = world_.createInvoice({{"p-1", 6}, {"p-1", 6}});

    EXPECT_THROW(world_.invoices->reserve(world_.warehouse, view.invoice.id),
                 domain::InsufficientStockException);
    EXPECT_EQ(world_.stockOf("p-1"), 10);
}

TEST_F(InvoiceServiceTest, Reserve_AccountantIsForbidden) {
    world_.addProduct("p-1", 10);
    auto view = world_.createInvoice({{"p-1", 1}});

    EXPECT_THROW(world_.invoices->reserve(world_.accountant, view.invoice.id), domain::ForbiddenException);
    EXPECT_EQ(world_.stockOf("p-1"), 10);
}

TEST_F(InvoiceServiceTest, UnknownInvoice_NotFound) {
    EXPECT_THROW(world_.invoices->reserve(world_.admin, "inv-missing"), domain::NotFoundException);
    EXPECT_THROW(world_.invoices->getInvoice(world_.admin, "inv-missing"), domain::NotFoundException);
}

// ============================================================================
// FULL LIFECYCLE
// ============================================================================

TEST_F(InvoiceServiceTest, Lifecycle_HappyPath) {
    world_.addProduct("p-1", 10);
    auto view = createAndReserve({{"p-1", 4}});
    const auto id = view.invoice.id;

    view = world_.invoices->approve(world_.accountant, id);
    EXPECT_EQ(view.invoice.status, domain::InvoiceStatus::APPROVED);

    view = world_.invoices->ship(world_.warehouse, id, InMemoryWorld::tracking());
    EXPECT_EQ(view.invoice.status, domain::InvoiceStatus::SHIPPED);
    ASSERT_TRUE(view.invoice.tracking.has_value());
    EXPECT_EQ(view.invoice.tracking->trackingCode, "TPX-0001");

    view = world_.invoices->deliver(world_.warehouse, id);
    EXPECT_EQ(view.invoice.status, domain::InvoiceStatus::DELIVERED);

    EXPECT_EQ(world_.stockOf("p-1"), 6);
}

TEST_F(InvoiceServiceTest, Ship_IsStockNeutral) {
    world_.addProduct("p-1", 10);
    auto view = createAndReserve({{"p-1", 4}});
    world_.invoices->approve(world_.accountant, view.invoice.id);
    const int64_t before = world_.stockOf("p-1");

    world_.invoices->ship(world_.warehouse, view.invoice.id, InMemoryWorld::tracking());

    EXPECT_EQ(world_.stockOf("p-1"), before);

    int shipMarks = 0;
    for (const auto& txn : ledgerOf(view.invoice.id)) {
        if (txn.kind == domain::TransactionKind::SHIP_MARK) {
            ++shipMarks;
            EXPECT_EQ(txn.delta, 0);
        }
    }
    EXPECT_EQ(shipMarks, 1);
}

TEST_F(InvoiceServiceTest, Ship_RequiresTracking) {
    world_.addProduct("p-1", 10);
    auto view = createAndReserve({{"p-1", 4}});
    world_.invoices->approve(world_.accountant, view.invoice.id);

    auto tracking = InMemoryWorld::tracking();
    tracking.trackingCode.clear();
    EXPECT_THROW(world_.invoices->ship(world_.warehouse, view.invoice.id, tracking), domain::ValidationException);

    tracking = InMemoryWorld::tracking();
    tracking.numberOfPackages = 0;
    EXPECT_THROW(world_.invoices->ship(world_.warehouse, view.invoice.id, tracking), domain::ValidationException);

    EXPECT_EQ(world_.invoices->getInvoice(world_.admin, view.invoice.id).invoice.status,
              domain::InvoiceStatus::APPROVED);
}

TEST_F(InvoiceServiceTest, OutOfOrder_InvalidTransition) {
    world_.addProduct("p-1", 10);
    auto view = world_.createInvoice({{"p-1", 1}});

    EXPECT_THROW(world_.invoices->approve(world_.admin, view.invoice.id), domain::InvalidTransitionException);
    EXPECT_THROW(world_.invoices->ship(world_.admin, view.invoice.id, InMemoryWorld::tracking()),
                 domain::InvalidTransitionException);
    EXPECT_THROW(world_.invoices->deliver(world_.admin, view.invoice.id), domain::InvalidTransitionException);
}

TEST_F(InvoiceServiceTest, InvalidTransition_TakesPrecedenceOverRole) {
    world_.addProduct("p-1", 10);
    auto view = world_.createInvoice({{"p-1", 1}});

    // складу approve не положен, но из warehouse_pending его нет ни для кого
    EXPECT_THROW(world_.invoices->approve(world_.warehouse, view.invoice.id),
                 domain::InvalidTransitionException);
}

// ============================================================================
// CANCEL
// ============================================================================

TEST_F(InvoiceServiceTest, Cancel_RestoresExactStock) {
    world_.addProduct("p-1", 10);
    auto view = createAndReserve({{"p-1", 8}});
    EXPECT_EQ(world_.stockOf("p-1"), 2);

    view = world_.invoices->cancel(world_.accountant, view.invoice.id);

    EXPECT_EQ(view.invoice.status, domain::InvoiceStatus::CANCELLED);
    EXPECT_EQ(world_.stockOf("p-1"), 10);

    domain::InventoryLedger ledger(ledgerOf(view.invoice.id));
    EXPECT_EQ(ledger.netDelta("p-1"), 0);
    EXPECT_FALSE(ledger.hasOpenReservation(view.invoice.id));
}

TEST_F(InvoiceServiceTest, Cancel_FromApproved_ReleasesReserve) {
    world_.addProduct("p-1", 10);
    world_.addProduct("p-2", 10);
    auto view = createAndReserve({{"p-1", 3}, {"p-2", 7}});
    world_.invoices->approve(world_.accountant, view.invoice.id);

    world_.invoices->cancel(world_.admin, view.invoice.id);

    EXPECT_EQ(world_.stockOf("p-1"), 10);
    EXPECT_EQ(world_.stockOf("p-2"), 10);
}

TEST_F(InvoiceServiceTest, Cancel_BeforeReserve_TouchesNothing) {
    world_.addProduct("p-1", 10);
    auto view = world_.createInvoice({{"p-1", 3}});

    world_.invoices->cancel(world_.accountant, view.invoice.id);

    EXPECT_EQ(world_.stockOf("p-1"), 10);
    EXPECT_TRUE(ledgerOf(view.invoice.id).empty());
}

TEST_F(InvoiceServiceTest, Cancel_Twice_SecondIsInvalidTransition) {
    world_.addProduct("p-1", 10);
    auto view = createAndReserve({{"p-1", 8}});
    world_.invoices->cancel(world_.accountant, view.invoice.id);

    EXPECT_THROW(world_.invoices->cancel(world_.accountant, view.invoice.id),
                 domain::InvalidTransitionException);

    // повторная отмена не возвращает товар второй раз
    EXPECT_EQ(world_.stockOf("p-1"), 10);
    EXPECT_EQ(ledgerOf(view.invoice.id).size(), 2u);
}

TEST_F(InvoiceServiceTest, Cancel_AfterShipment_Rejected) {
    world_.addProduct("p-1", 10);
    auto view = createAndReserve({{"p-1", 4}});
    world_.invoices->approve(world_.accountant, view.invoice.id);
    world_.invoices->ship(world_.warehouse, view.invoice.id, InMemoryWorld::tracking());

    EXPECT_THROW(world_.invoices->cancel(world_.admin, view.invoice.id), domain::InvalidTransitionException);
    EXPECT_EQ(world_.stockOf("p-1"), 6);
}

TEST_F(InvoiceServiceTest, Cancel_WarehouseIsForbidden) {
    world_.addProduct("p-1", 10);
    auto view = createAndReserve({{"p-1", 4}});

    // accountant_pending складу не виден, отказ тот же
    EXPECT_THROW(world_.invoices->cancel(world_.warehouse, view.invoice.id), domain::ForbiddenException);
    EXPECT_EQ(world_.stockOf("p-1"), 6);
}

// ============================================================================
// CLOSURE
// ============================================================================

TEST_F(InvoiceServiceTest, ClosedInvoices_HaveNoOpenReservation) {
    world_.addProduct("p-1", 20);

    auto delivered = createAndReserve({{"p-1", 5}});
    world_.invoices->approve(world_.accountant, delivered.invoice.id);
    world_.invoices->ship(world_.warehouse, delivered.invoice.id, InMemoryWorld::tracking());
    world_.invoices->deliver(world_.warehouse, delivered.invoice.id);

    auto cancelled = createAndReserve({{"p-1", 7}});
    world_.invoices->cancel(world_.accountant, cancelled.invoice.id);

    // доставленный счёт держит списание навсегда, отменённый вернул всё
    domain::InventoryLedger ledger(world_.store->allTransactions());
    EXPECT_EQ(ledger.openReservations(delivered.invoice.id).at("p-1"), 5);
    EXPECT_FALSE(ledger.hasOpenReservation(cancelled.invoice.id));
    EXPECT_TRUE(ledger.reconciles("p-1", 20, world_.stockOf("p-1")));
}

// ============================================================================
// READ
// ============================================================================

TEST_F(InvoiceServiceTest, GetInvoice_WarehouseCannotSeeAccountantQueue) {
    world_.addProduct("p-1", 10);
    auto view = createAndReserve({{"p-1", 1}});

    EXPECT_THROW(world_.invoices->getInvoice(world_.warehouse, view.invoice.id), domain::ForbiddenException);
    EXPECT_NO_THROW(world_.invoices->getInvoice(world_.accountant, view.invoice.id));
}
