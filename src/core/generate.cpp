/**
 * @file generate.cpp
 * @brief Stateless generation.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/generate.hpp"
#include "idforge/core/generator.hpp"
#include "idforge/utils/digest.hpp"
#include "idforge/utils/logger.hpp"
#include "idforge/utils/random.hpp"

#include "layout.hpp"

#include <array>
#include <cstring>

namespace idforge {
namespace core {

namespace {

using utils::Digest;

/**
 * Digest contexts that have already absorbed one of the well-known
 * namespaces. Copying one skips re-hashing the 16 namespace bytes.
 */
struct PrimedNamespaces {
    struct Entry {
        Uuid ns;
        Digest md5;
        Digest sha1;
    };

    std::array<Entry, 4> entries;

    PrimedNamespaces()
        : entries{{
            prime(NAMESPACE_DNS),
            prime(NAMESPACE_URL),
            prime(NAMESPACE_OID),
            prime(NAMESPACE_X500),
        }}
    {
        LOG_DEBUG("Generate", "Primed MD5/SHA-1 states for {} namespaces", entries.size());
    }

    static Entry prime(const Uuid& ns) {
        Entry entry{ns, Digest(Digest::Algorithm::MD5), Digest(Digest::Algorithm::SHA1)};
        entry.md5.update(ns.data(), Uuid::SIZE);
        entry.sha1.update(ns.data(), Uuid::SIZE);
        return entry;
    }

    const Digest* find(const Uuid& ns, Digest::Algorithm algorithm) const {
        for (const auto& entry : entries) {
            if (entry.ns == ns) {
                return algorithm == Digest::Algorithm::MD5 ? &entry.md5 : &entry.sha1;
            }
        }
        return nullptr;
    }
};

const PrimedNamespaces& primedNamespaces() {
    static const PrimedNamespaces primed;
    return primed;
}

Uuid nameBased(Digest::Algorithm algorithm, uint8_t version,
               const Uuid& ns, std::string_view name) {
    const Digest* primed = primedNamespaces().find(ns, algorithm);

    Digest digest = primed ? *primed : Digest(algorithm);
    if (!primed) {
        digest.update(ns.data(), Uuid::SIZE);
    }
    digest.update(name.data(), name.size());

    const Digest::Output out = digest.finalize();

    Uuid::Bytes bytes;
    std::memcpy(bytes.data(), out.bytes.data(), Uuid::SIZE);
    layout::setVersion(bytes.data(), version);
    layout::setRfcVariant(bytes.data());
    return Uuid(bytes);
}

}  // namespace

Uuid newV4() {
    Uuid::Bytes bytes;
    utils::fillRandom(bytes.data(), bytes.size());
    layout::setVersion(bytes.data(), 4);
    layout::setRfcVariant(bytes.data());
    return Uuid(bytes);
}

std::vector<Uuid> newV4Batch(size_t count) {
    std::vector<Uuid> ids;
    if (count == 0) {
        return ids;
    }
    ids.reserve(count);

    std::vector<uint8_t> raw(count * Uuid::SIZE);
    utils::fillRandom(raw.data(), raw.size());

    Uuid::Bytes bytes;
    for (size_t i = 0; i < count; ++i) {
        std::memcpy(bytes.data(), raw.data() + i * Uuid::SIZE, Uuid::SIZE);
        layout::setVersion(bytes.data(), 4);
        layout::setRfcVariant(bytes.data());
        ids.emplace_back(bytes);
    }
    return ids;
}

Uuid newV3(const Uuid& ns, std::string_view name) {
    return nameBased(Digest::Algorithm::MD5, 3, ns, name);
}

Uuid newV5(const Uuid& ns, std::string_view name) {
    return nameBased(Digest::Algorithm::SHA1, 5, ns, name);
}

Uuid newV8(const Uuid::Bytes& payload) {
    Uuid::Bytes bytes = payload;
    layout::setVersion(bytes.data(), 8);
    layout::setRfcVariant(bytes.data());
    return Uuid(bytes);
}

Uuid newV7() {
    return Generator::defaultInstance().newV7();
}

}  // namespace core
}  // namespace idforge
