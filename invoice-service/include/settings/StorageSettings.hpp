#pragma once

#include <string>
#include <cstdlib>

namespace invoicing::settings {

/**
 * @brief Выбор хранилища
 *
 * - INVOICING_STORAGE: "postgres" (default) или "memory"
 * - INVOICING_SEED_FILE: JSON с товарами/клиентами/сотрудниками для memory
 */
class StorageSettings {
public:
    StorageSettings() {
        if (const char* backend = std::getenv("INVOICING_STORAGE")) {
            backend_ = backend;
        }
        if (const char* seed = std::getenv("INVOICING_SEED_FILE")) {
            seedFile_ = seed;
        }
    }

    bool useInMemory() const { return backend_ == "memory"; }
    std::string getBackend() const { return backend_; }
    std::string getSeedFile() const { return seedFile_; }

private:
    std::string backend_ = "postgres";
    std::string seedFile_;
};

} // namespace invoicing::settings
