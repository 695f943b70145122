/*
Streamweave — ObsAuth Tests
Role: Verify the obs-websocket challenge-response string and its building blocks
Testing Strategy: Published reference vector plus RFC 4648 / FIPS 180-2 known answers
Coverage: base64 padding, sha256 digest size, full auth response, sensitivity to each input
*/
#include <gtest/gtest.h>
#include "obs/protocol/ObsAuth.hpp"
#include "fixtures/obs_frames.hpp"

// =============================================================================
// Primitives
// =============================================================================

TEST(ObsAuth, Base64Padding) {
    EXPECT_EQ(ObsAuth::base64Encode(""), "");
    EXPECT_EQ(ObsAuth::base64Encode("f"), "Zg==");
    EXPECT_EQ(ObsAuth::base64Encode("fo"), "Zm8=");
    EXPECT_EQ(ObsAuth::base64Encode("foo"), "Zm9v");
    EXPECT_EQ(ObsAuth::base64Encode("foobar"), "Zm9vYmFy");
}

TEST(ObsAuth, Sha256OfEmptyInput) {
    const auto digest = ObsAuth::sha256("");
    ASSERT_EQ(digest.size(), 32u);
    EXPECT_EQ(ObsAuth::base64Encode(digest), "47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=");
}

// =============================================================================
// Auth response
// =============================================================================

TEST(ObsAuth, MatchesProtocolDocumentationExample) {
    EXPECT_EQ(ObsAuth::computeAuthResponse(fixtures::kDocPassword, fixtures::kDocSalt, fixtures::kDocChallenge),
              fixtures::kDocAuth);
}

TEST(ObsAuth, ChangesWithEveryInput) {
    const std::string base = ObsAuth::computeAuthResponse(fixtures::kDocPassword, fixtures::kDocSalt, fixtures::kDocChallenge);
    EXPECT_NE(ObsAuth::computeAuthResponse("otherpassword", fixtures::kDocSalt, fixtures::kDocChallenge), base);
    EXPECT_NE(ObsAuth::computeAuthResponse(fixtures::kDocPassword, "salt", fixtures::kDocChallenge), base);
    EXPECT_NE(ObsAuth::computeAuthResponse(fixtures::kDocPassword, fixtures::kDocSalt, "challenge"), base);
}

TEST(ObsAuth, ResponseIsPaddedBase64OfDigest) {
    const auto auth = ObsAuth::computeAuthResponse("pw", "s", "c");
    EXPECT_EQ(auth.size(), 44u);
    EXPECT_EQ(auth.back(), '=');
}
