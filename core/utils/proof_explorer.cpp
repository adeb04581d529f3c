/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <span>
#include <unordered_map>

#include <boost/algorithm/string/split.hpp>
#include <fmt/format.h>

#include "application/impl/app_configuration_impl.hpp"
#include "commitment/chain_verifier.hpp"
#include "commitment/merkle_path.hpp"
#include "commitment/merkle_prefix.hpp"
#include "commitment/merkle_proof.hpp"
#include "commitment/merkle_root.hpp"
#include "common/hexutil.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "ics23/impl/proof_verifier_impl.hpp"
#include "utils/read_file.hpp"

using merklechain::commitment::ChainVerifier;
using merklechain::commitment::KeyPath;
using merklechain::commitment::MerklePath;
using merklechain::commitment::MerklePrefix;
using merklechain::commitment::MerkleProof;
using merklechain::commitment::MerkleRoot;
using merklechain::common::Buffer;

using ArgumentList = std::span<const std::string>;

class CommandExecutionError : public std::runtime_error {
 public:
  CommandExecutionError(std::string_view command_name, const std::string &what)
      : std::runtime_error{what}, command_name{command_name} {}

  friend std::ostream &operator<<(std::ostream &out,
                                  const CommandExecutionError &err) {
    return out << "Error in command '" << err.command_name
               << "': " << err.what() << "\n";
  }

 private:
  std::string_view command_name;
};

class Command {
 public:
  Command(std::string name, std::string arguments, std::string description)
      : name{std::move(name)},
        arguments{std::move(arguments)},
        description{std::move(description)} {}

  virtual ~Command() = default;

  /// @param args command name followed by its arguments
  virtual void execute(std::ostream &out, const ArgumentList &args) = 0;

  std::string_view getName() const {
    return name;
  }

  std::string_view getArguments() const {
    return arguments;
  }

  std::string_view getDescription() const {
    return description;
  }

 protected:
  void assertArgumentCount(const ArgumentList &args, size_t min, size_t max) {
    if (args.size() < min or args.size() > max) {
      throw CommandExecutionError{
          name,
          fmt::format("Argument count mismatch: expected {} to {}, got {}",
                      min,
                      max,
                      args.size())};
    }
  }

  template <typename... Ts>
  [[noreturn]] void throwError(const char *fmt, const Ts &...ts) const {
    throw CommandExecutionError(
        name, ::fmt::vformat(fmt, fmt::make_format_args(ts...)));
  }

  template <typename T>
  T unwrapResult(std::string_view context, outcome::result<T> &&res) const {
    if (res.has_value()) {
      return std::move(res).value();
    }
    throwError("{}: {}", context, res.error().message());
  }

  MerkleProof loadProof(const std::string &path) const {
    auto bytes = unwrapResult("Reading proof file", merklechain::readFile(path));
    return unwrapResult("Decoding proof", scale::decode<MerkleProof>(bytes));
  }

 private:
  std::string name;
  std::string arguments;
  std::string description;
};

class CommandParser {
 public:
  void addCommand(std::unique_ptr<Command> cmd) {
    std::string name{cmd->getName()};
    commands_.insert({name, std::move(cmd)});
  }

  /// @return exit code of the application
  int invoke(const ArgumentList &args) const {
    if (args.empty()) {
      std::cerr << "Unspecified command!\nAvailable commands are:\n";
      printCommands(std::cerr);
      return EXIT_FAILURE;
    }
    if (auto command = commands_.find(args[0]); command != commands_.cend()) {
      try {
        command->second->execute(std::cout, args);
        return EXIT_SUCCESS;
      } catch (CommandExecutionError &e) {
        std::cerr << "Command execution error: " << e;
      } catch (std::exception &e) {
        std::cerr << "Exception occurred: " << e.what() << "\n";
      }
    } else {
      std::cerr << "Unknown command '" << args[0]
                << "'!\nAvailable commands are:\n";
      printCommands(std::cerr);
    }
    return EXIT_FAILURE;
  }

  void printCommands(std::ostream &out) const {
    for (auto &[name, cmd] : commands_) {
      out << name << " " << cmd->getArguments() << "\n\t"
          << cmd->getDescription() << "\n";
    }
  }

 private:
  std::unordered_map<std::string, std::unique_ptr<Command>> commands_;
};

/// Each '/'-separated element of the path is one level of the chain
outcome::result<MerklePath> parsePath(std::string_view rendered) {
  std::vector<std::string> elements;
  boost::algorithm::split(
      elements, rendered, [](char c) { return c == '/'; });
  std::vector<KeyPath> key_paths;
  key_paths.reserve(elements.size());
  for (auto &element : elements) {
    OUTCOME_TRY(key_path, KeyPath::fromString(element));
    key_paths.emplace_back(std::move(key_path));
  }
  return MerklePath{std::move(key_paths)};
}

outcome::result<Buffer> parseHex(std::string_view hex) {
  if (hex.starts_with("0x")) {
    OUTCOME_TRY(bytes, merklechain::common::unhexWith0x(hex));
    return Buffer{std::move(bytes)};
  }
  OUTCOME_TRY(bytes, merklechain::common::unhex(hex));
  return Buffer{std::move(bytes)};
}

class PrintHelpCommand final : public Command {
 public:
  explicit PrintHelpCommand(const CommandParser &parser)
      : Command{"help", "", "print help message"}, parser{parser} {}

  void execute(std::ostream &out, const ArgumentList &args) override {
    assertArgumentCount(args, 1, 1);
    parser.printCommands(out);
  }

 private:
  const CommandParser &parser;
};

class VerificationCommand : public Command {
 public:
  VerificationCommand(std::shared_ptr<const ChainVerifier> verifier,
               std::string name,
               std::string arguments,
               std::string description)
      : Command{std::move(name), std::move(arguments), std::move(description)},
        verifier{std::move(verifier)} {}

 protected:
  void reportVerification(std::ostream &out,
                          const MerklePath &path,
                          outcome::result<void> res) const {
    if (res.has_error()) {
      throwError("Verification of {} failed: {}",
                 path.toString(),
                 res.error().message());
    }
    out << "Verified: " << path.toString() << "\n";
  }

  std::shared_ptr<const ChainVerifier> verifier;
};

class VerifyMembershipCommand final : public VerificationCommand {
 public:
  explicit VerifyMembershipCommand(
      std::shared_ptr<const ChainVerifier> verifier)
      : VerificationCommand{std::move(verifier),
                            "verify-membership",
                            "<root-hex> <path> <value-hex> <proof-file>",
                            "check that the value is stored under the path"} {}

  void execute(std::ostream &out, const ArgumentList &args) override {
    assertArgumentCount(args, 5, 5);
    MerkleRoot root{unwrapResult("Parsing root", parseHex(args[1]))};
    auto path = unwrapResult("Parsing path", parsePath(args[2]));
    auto value = unwrapResult("Parsing value", parseHex(args[3]));
    auto proof = loadProof(args[4]);
    reportVerification(
        out, path, verifier->verifyMembership(proof, root, path, value));
  }
};

class VerifyNonMembershipCommand final : public VerificationCommand {
 public:
  explicit VerifyNonMembershipCommand(
      std::shared_ptr<const ChainVerifier> verifier)
      : VerificationCommand{std::move(verifier),
                            "verify-non-membership",
                            "<root-hex> <path> <proof-file>",
                            "check that nothing is stored under the path"} {}

  void execute(std::ostream &out, const ArgumentList &args) override {
    assertArgumentCount(args, 4, 4);
    MerkleRoot root{unwrapResult("Parsing root", parseHex(args[1]))};
    auto path = unwrapResult("Parsing path", parsePath(args[2]));
    auto proof = loadProof(args[3]);
    reportVerification(
        out, path, verifier->verifyNonMembership(proof, root, path));
  }
};

class InspectProofCommand final : public Command {
 public:
  InspectProofCommand()
      : Command{"inspect-proof",
                "<proof-file>",
                "print levels of a chained proof"} {}

  void execute(std::ostream &out, const ArgumentList &args) override {
    assertArgumentCount(args, 2, 2);
    auto proof = loadProof(args[1]);
    if (auto res = proof.validateBasic(); res.has_error()) {
      out << "Malformed proof: " << res.error().message() << "\n";
    }
    for (size_t i = 0; i < proof.proofs().size(); ++i) {
      const auto &sub_proof = proof.proofs()[i];
      if (not sub_proof.has_value()) {
        out << "#" << i << ": missing\n";
        continue;
      }
      std::visit(
          [&](const auto &p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T,
                                         merklechain::ics23::ExistenceProof>) {
              out << fmt::format("#{}: existence of key {}, {} inner ops\n",
                                 i,
                                 p.key.toHex(),
                                 p.path.size());
            } else {
              out << fmt::format("#{}: non-existence of key {}{}{}\n",
                                 i,
                                 p.key.toHex(),
                                 p.left ? ", left " + p.left->key.toHex() : "",
                                 p.right ? ", right " + p.right->key.toHex()
                                         : "");
            }
          },
          *sub_proof);
    }
  }
};

class ApplyPrefixCommand final : public Command {
 public:
  ApplyPrefixCommand()
      : Command{"apply-prefix",
                "<prefix> <path>",
                "prepend the store prefix to the path"} {}

  void execute(std::ostream &out, const ArgumentList &args) override {
    assertArgumentCount(args, 3, 3);
    MerklePrefix prefix{Buffer::fromString(args[1])};
    auto path = unwrapResult("Parsing path", parsePath(args[2]));
    auto prefixed = unwrapResult(
        "Applying prefix", merklechain::commitment::applyPrefix(prefix, path));
    out << prefixed.toString() << "\n";
    out << unwrapResult("Rendering path", prefixed.pretty()) << "\n";
  }
};

int proof_explorer_main(int argc, const char **argv) {
  auto configuration =
      std::make_shared<merklechain::application::AppConfigurationImpl>();
  if (not configuration->initializeFromArgs(argc, argv)) {
    return EXIT_FAILURE;
  }
  if (auto res = merklechain::log::tuneLoggingSystem(configuration->log());
      res.has_error()) {
    std::cerr << "Invalid --log filter: " << res.error().message() << "\n";
    return EXIT_FAILURE;
  }

  auto hasher = std::make_shared<merklechain::crypto::HasherImpl>();
  auto proof_verifier =
      std::make_shared<merklechain::ics23::ProofVerifierImpl>(hasher);
  auto verifier = std::make_shared<const ChainVerifier>(
      proof_verifier,
      ChainVerifier::Config{.max_chain_length =
                                configuration->maxChainLength()});

  CommandParser parser;
  parser.addCommand(std::make_unique<PrintHelpCommand>(parser));
  parser.addCommand(std::make_unique<VerifyMembershipCommand>(verifier));
  parser.addCommand(std::make_unique<VerifyNonMembershipCommand>(verifier));
  parser.addCommand(std::make_unique<InspectProofCommand>());
  parser.addCommand(std::make_unique<ApplyPrefixCommand>());

  return parser.invoke(configuration->command());
}
