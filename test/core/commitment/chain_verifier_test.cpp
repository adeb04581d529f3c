/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "commitment/chain_verifier.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "commitment/commitment_error.hpp"
#include "commitment/merkle_prefix.hpp"
#include "commitment/merkle_root.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "ics23/impl/proof_verifier_impl.hpp"
#include "mock/ics23/proof_verifier_mock.hpp"
#include "testutil/ics23/simple_tree.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using merklechain::common::Buffer;
using merklechain::common::BufferView;
using merklechain::commitment::applyPrefix;
using merklechain::commitment::ChainVerifier;
using merklechain::commitment::CommitmentError;
using merklechain::commitment::CommitmentType;
using merklechain::commitment::MerklePath;
using merklechain::commitment::MerklePrefix;
using merklechain::commitment::MerkleProof;
using merklechain::commitment::MerkleRoot;
using merklechain::commitment::Path;
using merklechain::crypto::HasherImpl;
using merklechain::ics23::ProofVerifierImpl;
using merklechain::ics23::ProofVerifierMock;
using testutil::SimpleTree;
using testing::_;
using testing::Eq;
using testing::InSequence;
using testing::Return;

using namespace merklechain::common::literals;

namespace {
  class PlainPath final : public Path {
   public:
    CommitmentType getCommitmentType() const override {
      return CommitmentType::MERKLE;
    }

    std::string toString() const override {
      return "ibc/a";
    }

    bool isEmpty() const override {
      return false;
    }
  };
}  // namespace

/**
 * Two nested trees: the store tree keeps "a", "c", "d" and its root is kept
 * under "ibc" in the outer tree
 */
class ChainVerifierTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    store_ = std::make_unique<SimpleTree>(std::map<Buffer, Buffer>{
        {"a"_buf, "hello"_buf},
        {"c"_buf, "world"_buf},
        {"d"_buf, "!"_buf},
    });
    outer_ = std::make_unique<SimpleTree>(std::map<Buffer, Buffer>{
        {"bank"_buf, "ff"_hex2buf},
        {"ibc"_buf, store_->root()},
        {"staking"_buf, "00"_hex2buf},
    });
    root_ = MerkleRoot{outer_->root()};
  }

  MerklePath prefixedPath(const std::string &key) const {
    return applyPrefix(MerklePrefix{"ibc"_buf}, MerklePath::fromSegments({key}))
        .value();
  }

  MerkleProof membershipProof(const Buffer &key) const {
    return MerkleProof{
        {store_->existenceProof(key), outer_->existenceProof("ibc"_buf)},
        {SimpleTree::spec(), SimpleTree::spec()}};
  }

  MerkleProof nonMembershipProof(const Buffer &key) const {
    return MerkleProof{
        {store_->nonExistenceProof(key), outer_->existenceProof("ibc"_buf)},
        {SimpleTree::spec(), SimpleTree::spec()}};
  }

  std::shared_ptr<ProofVerifierImpl> proof_verifier_ =
      std::make_shared<ProofVerifierImpl>(std::make_shared<HasherImpl>());
  ChainVerifier verifier_{proof_verifier_, ChainVerifier::Config{}};

  std::unique_ptr<SimpleTree> store_;
  std::unique_ptr<SimpleTree> outer_;
  MerkleRoot root_;
};

/**
 * @given two level proof of "a" under prefix "ibc"
 * @when membership of the right value verified
 * @then it is accepted
 */
TEST_F(ChainVerifierTest, VerifyMembership) {
  EXPECT_OUTCOME_TRUE_1(verifier_.verifyMembership(
      membershipProof("a"_buf), root_, prefixedPath("a"), "hello"_buf));
}

/**
 * @given single level proof of "a" against the store root
 * @when membership verified
 * @then it is accepted
 */
TEST_F(ChainVerifierTest, VerifyMembershipSingleLevel) {
  MerkleProof proof{{store_->existenceProof("a"_buf)}, {SimpleTree::spec()}};
  EXPECT_OUTCOME_TRUE_1(
      verifier_.verifyMembership(proof,
                                 MerkleRoot{store_->root()},
                                 MerklePath::fromSegments({"a"}),
                                 "hello"_buf));
}

/**
 * @given valid two level proof
 * @when verified with another value, another key or another root
 * @then it is rejected
 */
TEST_F(ChainVerifierTest, VerifyMembershipWrongInputs) {
  auto proof = membershipProof("a"_buf);
  EXPECT_EC(
      verifier_.verifyMembership(proof, root_, prefixedPath("a"), "world"_buf),
      CommitmentError::INVALID_PROOF);
  EXPECT_EC(
      verifier_.verifyMembership(proof, root_, prefixedPath("c"), "hello"_buf),
      CommitmentError::INVALID_PROOF);

  auto root = outer_->root();
  root.back() ^= 0x80;
  EXPECT_EC(verifier_.verifyMembership(
                proof, MerkleRoot{root}, prefixedPath("a"), "hello"_buf),
            CommitmentError::INVALID_PROOF);
}

/**
 * @given valid two level proof with sub-proofs in reversed order
 * @when verified
 * @then it is rejected
 */
TEST_F(ChainVerifierTest, VerifyMembershipReversedOrder) {
  auto proof = membershipProof("a"_buf);
  MerkleProof reversed{{proof.proofs()[1], proof.proofs()[0]}, proof.specs()};
  EXPECT_EC(verifier_.verifyMembership(
                reversed, root_, prefixedPath("a"), "hello"_buf),
            CommitmentError::INVALID_PROOF);
}

/**
 * @given proof of the store level alone, claimed against the outer root
 * @when verified
 * @then it is rejected because the chain is not anchored to the root
 */
TEST_F(ChainVerifierTest, VerifyMembershipUnanchored) {
  MerkleProof proof{{store_->existenceProof("a"_buf)}, {SimpleTree::spec()}};
  EXPECT_EC(verifier_.verifyMembership(
                proof, root_, MerklePath::fromSegments({"a"}), "hello"_buf),
            CommitmentError::INVALID_PROOF);
}

/**
 * @given valid two level proof with a byte of the store level proof altered
 * @when verified
 * @then it is rejected
 */
TEST_F(ChainVerifierTest, VerifyMembershipTamperedProof) {
  auto store_proof = store_->existenceProof("a"_buf);
  ASSERT_FALSE(store_proof.path.empty());
  store_proof.path[0].suffix[0] ^= 1;
  MerkleProof proof{{store_proof, outer_->existenceProof("ibc"_buf)},
                    {SimpleTree::spec(), SimpleTree::spec()}};
  EXPECT_EC(
      verifier_.verifyMembership(proof, root_, prefixedPath("a"), "hello"_buf),
      CommitmentError::INVALID_PROOF);
}

/**
 * @given non-existence proof at a level where existence is required
 * @when membership verified
 * @then it is rejected
 */
TEST_F(ChainVerifierTest, VerifyMembershipWithNonExistence) {
  auto proof = nonMembershipProof("b"_buf);
  EXPECT_EC(
      verifier_.verifyMembership(proof, root_, prefixedPath("b"), "hello"_buf),
      CommitmentError::INVALID_PROOF);
}

/**
 * @given inputs violating preconditions: empty value, empty root, empty
 * path, foreign path, malformed proof
 * @when membership verified
 * @then INVALID_PROOF is returned
 */
TEST_F(ChainVerifierTest, VerifyMembershipPreconditions) {
  auto proof = membershipProof("a"_buf);
  auto path = prefixedPath("a");
  EXPECT_EC(verifier_.verifyMembership(proof, root_, path, Buffer{}),
            CommitmentError::INVALID_PROOF);
  EXPECT_EC(verifier_.verifyMembership(proof, MerkleRoot{}, path, "hello"_buf),
            CommitmentError::INVALID_PROOF);
  EXPECT_EC(verifier_.verifyMembership(proof, root_, MerklePath{}, "hello"_buf),
            CommitmentError::INVALID_PROOF);
  EXPECT_EC(verifier_.verifyMembership(proof, root_, PlainPath{}, "hello"_buf),
            CommitmentError::INVALID_PROOF);

  MerkleProof no_spec{proof.proofs(), {SimpleTree::spec(), std::nullopt}};
  EXPECT_EC(verifier_.verifyMembership(no_spec, root_, path, "hello"_buf),
            CommitmentError::INVALID_PROOF);
}

/**
 * @given chain of two levels and a verifier accepting one level at most
 * @when membership verified
 * @then it is rejected
 */
TEST_F(ChainVerifierTest, VerifyMembershipTooLong) {
  ChainVerifier verifier{proof_verifier_,
                         ChainVerifier::Config{.max_chain_length = 1}};
  EXPECT_EC(verifier.verifyMembership(membershipProof("a"_buf),
                                      root_,
                                      prefixedPath("a"),
                                      "hello"_buf),
            CommitmentError::INVALID_PROOF);
}

/**
 * @given proof of two levels and a path of one level
 * @when membership verified
 * @then it is rejected before any proof is evaluated
 */
TEST_F(ChainVerifierTest, VerifyMembershipLengthMismatch) {
  auto mock = std::make_shared<ProofVerifierMock>();
  EXPECT_CALL(*mock, calculate(_)).Times(0);
  EXPECT_CALL(*mock, verifyMembership(_, _, _, _, _)).Times(0);
  ChainVerifier verifier{mock, ChainVerifier::Config{}};

  EXPECT_EC(verifier.verifyMembership(membershipProof("a"_buf),
                                      root_,
                                      MerklePath::fromSegments({"a"}),
                                      "hello"_buf),
            CommitmentError::INVALID_PROOF);
}

/**
 * @given two level proof
 * @when membership verified
 * @then the lowest level is checked against its own root with the innermost
 * key and the value, the last one against the trusted root with the
 * outermost key and the lower root
 */
TEST_F(ChainVerifierTest, VerifyMembershipLevelOrder) {
  auto mock = std::make_shared<ProofVerifierMock>();
  ChainVerifier verifier{mock, ChainVerifier::Config{}};

  auto store_root = "5702"_hex2buf;
  auto outer_root = "0c7e"_hex2buf;
  auto trusted = "1234"_hex2buf;
  auto value = "hello"_buf;
  auto store_key = "a"_buf;
  auto outer_key = "ibc"_buf;
  {
    InSequence s;
    EXPECT_CALL(*mock, calculate(_)).WillOnce(Return(store_root));
    EXPECT_CALL(*mock,
                verifyMembership(_,
                                 Eq(BufferView{store_root}),
                                 _,
                                 Eq(BufferView{store_key}),
                                 Eq(BufferView{value})))
        .WillOnce(Return(true));
    EXPECT_CALL(*mock, calculate(_)).WillOnce(Return(outer_root));
    EXPECT_CALL(*mock,
                verifyMembership(_,
                                 Eq(BufferView{trusted}),
                                 _,
                                 Eq(BufferView{outer_key}),
                                 Eq(BufferView{store_root})))
        .WillOnce(Return(true));
  }

  EXPECT_OUTCOME_TRUE_1(verifier.verifyMembership(membershipProof("a"_buf),
                                                  MerkleRoot{trusted},
                                                  prefixedPath("a"),
                                                  value));
}

/**
 * @given two level proof of absence of "b" in the store
 * @when non-membership verified
 * @then it is accepted
 */
TEST_F(ChainVerifierTest, VerifyNonMembership) {
  EXPECT_OUTCOME_TRUE_1(verifier_.verifyNonMembership(
      nonMembershipProof("b"_buf), root_, prefixedPath("b")));
}

/**
 * @given single level proof of absence of "b"
 * @when non-membership verified against the store root and another root
 * @then only the store root is accepted
 */
TEST_F(ChainVerifierTest, VerifyNonMembershipSingleLevel) {
  MerkleProof proof{{store_->nonExistenceProof("b"_buf)},
                    {SimpleTree::spec()}};
  auto path = MerklePath::fromSegments({"b"});
  EXPECT_OUTCOME_TRUE_1(
      verifier_.verifyNonMembership(proof, MerkleRoot{store_->root()}, path));
  EXPECT_EC(verifier_.verifyNonMembership(proof, root_, path),
            CommitmentError::INVALID_PROOF);
}

/**
 * @given valid proof of absence
 * @when verified for a present key, under another root
 * @then it is rejected
 */
TEST_F(ChainVerifierTest, VerifyNonMembershipWrongInputs) {
  auto proof = nonMembershipProof("b"_buf);
  EXPECT_EC(verifier_.verifyNonMembership(proof, root_, prefixedPath("c")),
            CommitmentError::INVALID_PROOF);

  auto root = outer_->root();
  root.front() ^= 1;
  EXPECT_EC(
      verifier_.verifyNonMembership(proof, MerkleRoot{root}, prefixedPath("b")),
      CommitmentError::INVALID_PROOF);
}

/**
 * @given proof with an existence proof at the lowest level
 * @when non-membership verified
 * @then it is rejected
 */
TEST_F(ChainVerifierTest, VerifyNonMembershipWithExistence) {
  EXPECT_EC(verifier_.verifyNonMembership(
                membershipProof("a"_buf), root_, prefixedPath("a")),
            CommitmentError::INVALID_PROOF);
}

/**
 * @given proof of absence of a key smaller than any key of the store, which
 * has no left neighbour
 * @when non-membership verified
 * @then it is rejected
 */
TEST_F(ChainVerifierTest, VerifyNonMembershipWithoutLeftNeighbour) {
  auto proof = nonMembershipProof("0"_buf);
  ASSERT_FALSE(std::get<merklechain::ics23::NonExistenceProof>(
                   *proof.proofs()[0])
                   .left.has_value());
  EXPECT_EC(verifier_.verifyNonMembership(proof, root_, prefixedPath("0")),
            CommitmentError::INVALID_PROOF);
}

/**
 * @given proof of two levels and a path of three levels
 * @when non-membership verified
 * @then it is rejected before any proof is evaluated
 */
TEST_F(ChainVerifierTest, VerifyNonMembershipLengthMismatch) {
  auto mock = std::make_shared<ProofVerifierMock>();
  EXPECT_CALL(*mock, calculate(_)).Times(0);
  EXPECT_CALL(*mock, verifyNonMembership(_, _, _, _)).Times(0);
  ChainVerifier verifier{mock, ChainVerifier::Config{}};

  auto path =
      applyPrefix(MerklePrefix{"root"_buf}, prefixedPath("b")).value();
  ASSERT_EQ(path.keyPaths().size(), 3);
  EXPECT_EC(
      verifier.verifyNonMembership(nonMembershipProof("b"_buf), root_, path),
      CommitmentError::INVALID_PROOF);
}

/**
 * @given proof with two sub-proofs and a single spec
 * @when membership and non-membership verified
 * @then both are rejected before any proof is evaluated
 */
TEST_F(ChainVerifierTest, SpecsCountMismatch) {
  auto mock = std::make_shared<ProofVerifierMock>();
  EXPECT_CALL(*mock, calculate(_)).Times(0);
  EXPECT_CALL(*mock, verifyMembership(_, _, _, _, _)).Times(0);
  EXPECT_CALL(*mock, verifyNonMembership(_, _, _, _)).Times(0);
  ChainVerifier verifier{mock, ChainVerifier::Config{}};

  auto path = prefixedPath("a");
  MerkleProof membership{membershipProof("a"_buf).proofs(),
                         {SimpleTree::spec()}};
  MerkleProof non_membership{nonMembershipProof("b"_buf).proofs(),
                             {SimpleTree::spec()}};

  EXPECT_EC(verifier.verifyMembership(membership, root_, path, "hello"_buf),
            CommitmentError::INVALID_PROOF);
  EXPECT_EC(verifier.verifyNonMembership(non_membership, root_, path),
            CommitmentError::INVALID_PROOF);
}
