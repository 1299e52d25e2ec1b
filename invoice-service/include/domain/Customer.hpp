#pragma once

#include <string>
#include <vector>

namespace invoicing::domain {

struct BankAccount {
    std::string bankName;
    std::string accountNumber;
    std::string iban;
};

struct Customer {
    std::string id;
    std::string firstName;
    std::string lastName;
    std::string phone;
    std::string city;
    std::vector<BankAccount> bankAccounts;

    std::string fullName() const {
        return firstName + " " + lastName;
    }
};

} // namespace invoicing::domain
