/**
 * @file idforge_demo.cpp
 * @brief Example: generating, parsing and encoding identifiers with idforge
 *
 * Honors IDFORGE_LOG_LEVEL, IDFORGE_LOG_COLOR and IDFORGE_POOL_SIZE.
 */

#include <idforge/core/generate.hpp>
#include <idforge/core/generator.hpp>
#include <idforge/core/parse.hpp>
#include <idforge/core/pool.hpp>
#include <idforge/core/scan.hpp>
#include <idforge/utils/config.hpp>

#include <chrono>
#include <iostream>
#include <string>

using namespace idforge;

int main(int argc, char* argv[]) {
    try {
        utils::Config config = utils::loadConfigFromEnv();
        utils::applyConfig(config);

        // Stateless kinds
        std::cout << "v4: " << core::newV4() << "\n";
        std::cout << "v5: " << core::newV5(core::NAMESPACE_DNS, "www.example.com") << "\n";
        std::cout << "v3: " << core::newV3(core::NAMESPACE_DNS, "www.example.com") << "\n";

        // Time-ordered, isolated stream
        core::Generator generator;
        for (const auto& id : generator.newV7Batch(3)) {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                id.timestamp().time_since_epoch());
            std::cout << "v7: " << id << "  ms=" << ms.count() << "\n";
        }

        // Buffered generation
        core::Pool pool(config);
        std::cout << "pooled v7: " << pool.newV7() << " (pool size " << pool.size() << ")\n";

        // Parse whatever the user passed, in any accepted form
        for (int i = 1; i < argc; ++i) {
            auto parsed = core::tryParseLenient(argv[i]);
            if (!parsed) {
                std::cerr << "not an identifier: " << argv[i] << "\n";
                continue;
            }
            std::cout << argv[i] << " -> " << parsed->toUrn()
                      << " version=" << core::versionToString(parsed->version())
                      << " variant=" << core::variantToString(parsed->variant()) << "\n";
        }

        // Text columns accept any form, and always get the canonical one back
        core::Uuid stored = core::scan(std::string("{6ba7b810-9dad-11d1-80b4-00c04fd430c8}"));
        std::cout << "scanned: " << std::get<std::string>(core::value(stored)) << "\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
