#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>

#include "network/peer_registry.hpp"

using namespace lanlink;
using namespace lanlink::network;

TEST_CASE("Property: after a sweep every device is fresh", "[property][registry]") {
    rc::check("expire(now) leaves only devices seen within 30 s", [] {
        PeerRegistry registry(0);
        const auto sightings = *rc::gen::container<std::vector<std::pair<int, int64_t>>>(
            rc::gen::pair(rc::gen::inRange(1, 20), rc::gen::inRange<int64_t>(0, 120'000)));

        for (const auto& [host, at] : sightings) {
            const auto ip = QStringLiteral("10.0.0.%1").arg(host);
            registry.upsert(Announcement{ip, QStringLiteral("h%1").arg(host), static_cast<InstanceId>(host)},
                            Timestamp(at));
        }

        const Timestamp now(*rc::gen::inRange<int64_t>(0, 200'000));
        registry.expire(now);

        for (const auto& device : registry.snapshot()) {
            RC_ASSERT(now - device.last_seen <= PeerRegistry::kStaleAfter);
        }
    });
}

TEST_CASE("Property: the local instance never appears", "[property][registry]") {
    rc::check("upserts carrying the local id are dropped", [](uint32_t local) {
        PeerRegistry registry(local);
        RC_ASSERT(!registry.upsert(Announcement{QStringLiteral("10.0.0.1"), QStringLiteral("me"), local},
                                   Timestamp(1)));
        RC_ASSERT(registry.size() == 0u);
    });
}
