/**
 * @file test_room_registry.cpp
 * @brief Tests for room creation, access codes, joining and expiry
 */

#include <gtest/gtest.h>
#include <chrono>
#include <regex>
#include <set>
#include <string>
#include <thread>

#include "AccessCode.h"
#include "ErrorCodes.h"
#include "EventBus.h"
#include "P2PEvents.h"
#include "RoomRegistry.h"
#include "TestHelpers.h"

using namespace CubeLink;
using namespace std::chrono_literals;

class RoomRegistryTest : public ::testing::Test {
protected:
    P2PSettings settingsWithTtl(std::chrono::seconds ttl) {
        auto settings = test::testSettings();
        settings.roomTtl = ttl;
        return settings;
    }

    EventBus bus_;
};

TEST_F(RoomRegistryTest, CreateThenJoin) {
    RoomRegistry registry(test::testSettings(), bus_);

    auto created = registry.createRoom(2);
    ASSERT_TRUE(created.isOk());
    const Room& room = created.value();
    EXPECT_EQ(room.peerCount, 0u);
    EXPECT_EQ(room.maxPeers, 2u);
    EXPECT_TRUE(room.isHost);
    EXPECT_TRUE(std::regex_match(room.roomCode, std::regex("^\\d{6}$")));
    EXPECT_EQ(room.expiresAt - room.createdAt, 24u * 60 * 60 * 1000);

    auto joined = registry.joinRoom(room.roomCode);
    ASSERT_TRUE(joined.isOk());
    EXPECT_EQ(joined.value().roomId, room.roomId);
    EXPECT_EQ(joined.value().peerCount, 1u);
    EXPECT_FALSE(joined.value().isHost);

    auto stored = registry.getRoom(room.roomId);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->peerCount, 1u);
}

TEST_F(RoomRegistryTest, ZeroMaxPeersUsesDefault) {
    RoomRegistry registry(test::testSettings(), bus_);
    auto created = registry.createRoom(0);
    ASSERT_TRUE(created.isOk());
    EXPECT_EQ(created.value().maxPeers, test::testSettings().defaultMaxPeers);
}

TEST_F(RoomRegistryTest, UnknownCodeAndFullRoom) {
    RoomRegistry registry(test::testSettings(), bus_);

    auto unknown = registry.joinRoom("000000");
    ASSERT_TRUE(unknown.isError());
    EXPECT_TRUE(hasCode(unknown.error(), ErrorCode::ROOM_NOT_FOUND));

    auto room = registry.createRoom(1);
    ASSERT_TRUE(room.isOk());
    ASSERT_TRUE(registry.joinRoom(room.value().roomCode).isOk());

    auto full = registry.joinRoom(room.value().roomCode);
    ASSERT_TRUE(full.isError());
    EXPECT_TRUE(hasCode(full.error(), ErrorCode::ROOM_FULL));
}

TEST_F(RoomRegistryTest, FormattedCodeIsAccepted) {
    RoomRegistry registry(test::testSettings(), bus_);
    auto room = registry.createRoom(2);
    ASSERT_TRUE(room.isOk());

    auto joined = registry.joinRoom(AccessCode::format(room.value().roomCode));
    ASSERT_TRUE(joined.isOk());
    EXPECT_EQ(joined.value().roomId, room.value().roomId);
}

TEST_F(RoomRegistryTest, CodesAreUniqueAmongLiveRooms) {
    RoomRegistry registry(test::testSettings(), bus_);
    std::set<std::string> codes;
    for (int i = 0; i < 200; ++i) {
        auto room = registry.createRoom(2);
        ASSERT_TRUE(room.isOk());
        EXPECT_TRUE(codes.insert(room.value().roomCode).second);
    }
    EXPECT_EQ(registry.listRooms().size(), 200u);
}

TEST_F(RoomRegistryTest, CollidingCodeIsRedrawn) {
    std::vector<std::string> draws{"111111", "111111", "222222"};
    size_t calls = 0;
    RoomRegistry registry(test::testSettings(), bus_, [&]() { return draws.at(calls++); });

    auto first = registry.createRoom(2);
    ASSERT_TRUE(first.isOk());
    EXPECT_EQ(first.value().roomCode, "111111");

    auto second = registry.createRoom(2);
    ASSERT_TRUE(second.isOk());
    EXPECT_EQ(second.value().roomCode, "222222");
    EXPECT_EQ(calls, 3u);

    EXPECT_EQ(registry.findByCode("111111")->roomId, first.value().roomId);
    EXPECT_EQ(registry.findByCode("222222")->roomId, second.value().roomId);
}

TEST_F(RoomRegistryTest, CodeSpaceExhaustionFailsCreate) {
    auto settings = test::testSettings();
    settings.codeMaxAttempts = 5;
    int calls = 0;
    RoomRegistry registry(settings, bus_, [&]() {
        ++calls;
        return std::string("333333");
    });

    ASSERT_TRUE(registry.createRoom(2).isOk());
    int created = 0;
    bus_.subscribe(events::ROOM_CREATED, [&](const std::any&) { ++created; });

    auto exhausted = registry.createRoom(2);
    ASSERT_TRUE(exhausted.isError());
    EXPECT_TRUE(hasCode(exhausted.error(), ErrorCode::ROOM_CODE_EXHAUSTED));
    EXPECT_EQ(calls, 1 + settings.codeMaxAttempts);
    EXPECT_EQ(created, 0);
    EXPECT_EQ(registry.listRooms().size(), 1u);
}

TEST_F(RoomRegistryTest, ExpiredRoomGivesUpItsCode) {
    RoomRegistry registry(settingsWithTtl(0s), bus_, []() { return std::string("444444"); });

    auto stale = registry.createRoom(2);
    ASSERT_TRUE(stale.isOk());
    ASSERT_TRUE(registry.addPeer(stale.value().roomId, "peer_old").isOk());

    std::this_thread::sleep_for(5ms);
    auto fresh = registry.createRoom(2);
    ASSERT_TRUE(fresh.isOk());
    EXPECT_EQ(fresh.value().roomCode, "444444");
    EXPECT_NE(fresh.value().roomId, stale.value().roomId);

    EXPECT_FALSE(registry.hasRoom(stale.value().roomId));
    EXPECT_TRUE(registry.listPeers(stale.value().roomId).empty());
    EXPECT_EQ(registry.findByCode("444444")->roomId, fresh.value().roomId);
    EXPECT_EQ(registry.listRooms().size(), 1u);
}

TEST_F(RoomRegistryTest, ExpiredRoomRejectsJoin) {
    RoomRegistry registry(settingsWithTtl(0s), bus_);
    auto room = registry.createRoom(2);
    ASSERT_TRUE(room.isOk());

    std::this_thread::sleep_for(5ms);
    auto joined = registry.joinRoom(room.value().roomCode);
    ASSERT_TRUE(joined.isError());
    EXPECT_TRUE(hasCode(joined.error(), ErrorCode::ROOM_EXPIRED));
}

TEST_F(RoomRegistryTest, FullIsReportedBeforeExpired) {
    RoomRegistry registry(settingsWithTtl(1s), bus_);
    auto room = registry.createRoom(1);
    ASSERT_TRUE(room.isOk());
    ASSERT_TRUE(registry.joinRoom(room.value().roomCode).isOk());

    std::this_thread::sleep_for(1100ms);
    auto joined = registry.joinRoom(room.value().roomCode);
    ASSERT_TRUE(joined.isError());
    EXPECT_TRUE(hasCode(joined.error(), ErrorCode::ROOM_FULL));
}

TEST_F(RoomRegistryTest, PurgeExpiredRemovesOnlyExpired) {
    RoomRegistry shortLived(settingsWithTtl(0s), bus_);
    ASSERT_TRUE(shortLived.createRoom(2).isOk());
    ASSERT_TRUE(shortLived.createRoom(2).isOk());

    std::this_thread::sleep_for(5ms);
    EXPECT_EQ(shortLived.purgeExpired(), 2u);
    EXPECT_TRUE(shortLived.listRooms().empty());

    RoomRegistry longLived(test::testSettings(), bus_);
    ASSERT_TRUE(longLived.createRoom(2).isOk());
    EXPECT_EQ(longLived.purgeExpired(), 0u);
    EXPECT_EQ(longLived.listRooms().size(), 1u);
}

TEST_F(RoomRegistryTest, LeaveRoomDestroysRoomAndFreesCode) {
    RoomRegistry registry(test::testSettings(), bus_);
    std::vector<std::string> left;
    bus_.subscribe(events::ROOM_LEFT, [&](const std::any& data) {
        left.push_back(std::any_cast<const Room&>(data).roomId);
    });

    auto room = registry.createRoom(2);
    ASSERT_TRUE(room.isOk());
    ASSERT_TRUE(registry.joinRoom(room.value().roomCode).isOk());

    EXPECT_TRUE(registry.leaveRoom(room.value().roomId));
    EXPECT_FALSE(registry.hasRoom(room.value().roomId));
    EXPECT_FALSE(registry.findByCode(room.value().roomCode).has_value());
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0], room.value().roomId);

    EXPECT_FALSE(registry.leaveRoom(room.value().roomId));
}

TEST_F(RoomRegistryTest, DepartPeerClosesRoomWithLastPeer) {
    RoomRegistry registry(test::testSettings(), bus_);
    auto room = registry.createRoom(3, "peer_host0001");
    ASSERT_TRUE(room.isOk());
    const auto roomId = room.value().roomId;

    ASSERT_TRUE(registry.joinRoom(room.value().roomCode, "peer_aaaa0001").isOk());
    ASSERT_TRUE(registry.joinRoom(room.value().roomCode, "peer_bbbb0002").isOk());
    EXPECT_EQ(registry.listPeers(roomId).size(), 3u);

    ASSERT_TRUE(registry.departPeer(roomId, "peer_aaaa0001").isOk());
    ASSERT_TRUE(registry.hasRoom(roomId));
    EXPECT_EQ(registry.getRoom(roomId)->peerCount, 1u);
    EXPECT_EQ(registry.listPeers(roomId).size(), 2u);

    ASSERT_TRUE(registry.departPeer(roomId, "peer_bbbb0002").isOk());
    EXPECT_FALSE(registry.hasRoom(roomId));

    auto gone = registry.departPeer(roomId, "peer_host0001");
    ASSERT_TRUE(gone.isError());
    EXPECT_TRUE(hasCode(gone.error(), ErrorCode::ROOM_NOT_FOUND));
}

TEST_F(RoomRegistryTest, PeerRoster) {
    RoomRegistry registry(test::testSettings(), bus_);
    std::vector<std::string> joinedPeers;
    bus_.subscribe(events::PEER_JOINED, [&](const std::any& data) {
        joinedPeers.push_back(std::any_cast<const Peer&>(data).peerId);
    });

    auto room = registry.createRoom(2);
    ASSERT_TRUE(room.isOk());
    const auto roomId = room.value().roomId;

    ASSERT_TRUE(registry.addPeer(roomId, "peer_1").isOk());
    ASSERT_TRUE(registry.addPeer(roomId, "peer_1").isOk());
    EXPECT_EQ(joinedPeers.size(), 1u);
    EXPECT_TRUE(registry.markPeerSeen(roomId, "peer_1"));
    EXPECT_FALSE(registry.markPeerSeen(roomId, "peer_unknown"));

    auto peers = registry.listPeers(roomId);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_TRUE(peers[0].connected);

    EXPECT_TRUE(registry.removePeer(roomId, "peer_1"));
    EXPECT_FALSE(registry.removePeer(roomId, "peer_1"));
    EXPECT_TRUE(registry.listPeers(roomId).empty());

    auto missing = registry.addPeer("no-such-room", "peer_2");
    ASSERT_TRUE(missing.isError());
    EXPECT_TRUE(hasCode(missing.error(), ErrorCode::ROOM_NOT_FOUND));
}

TEST_F(RoomRegistryTest, AccessCodeHelpers) {
    for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE(AccessCode::isValid(AccessCode::generate()));
    }
    EXPECT_FALSE(AccessCode::isValid("12345"));
    EXPECT_FALSE(AccessCode::isValid("12a456"));
    EXPECT_EQ(AccessCode::format("123456"), "123-456");
    EXPECT_EQ(AccessCode::normalize("123-456"), "123456");
    EXPECT_EQ(AccessCode::normalize(" 123 456 "), "123456");
}
