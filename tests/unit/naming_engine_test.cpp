#include "internal/naming/naming_engine.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using credpool::db::model::CredentialRecord;
using credpool::naming::FormatFilename;
using credpool::naming::kDefaultNamingPattern;
using credpool::naming::Requester;

CredentialRecord MakeRecord() {
  CredentialRecord r;
  r.id                    = 42;
  r.material.ipv4_address = "10.8.0.2";
  r.material.endpoint     = "vpn.example.net:51820";
  r.request_batch_id      = "0123456789abcdef-0000";
  return r;
}

bool MatchesFilenameContract(const std::string& name) {
  if (name.size() < 5 || name.compare(name.size() - 5, 5, ".conf") != 0) return false;
  for (unsigned char c : name) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' ||
                    c == '_' || c == '-' || c == '{' || c == '}';
    if (!ok) return false;
  }
  return true;
}

void TestDefaultPattern() {
  assert(FormatFilename(kDefaultNamingPattern, MakeRecord()) == "simnet_10.8.0.2.conf");
}

void TestEveryPlaceholder() {
  const auto name = FormatFilename("{id}-{ipv4_address}-{endpoint}-{batch_id}-{username}-{user_id}-{index}",
                                   MakeRecord(), Requester{7, "alice"}, 3u);
  assert(name == "42-10.8.0.2-vpn.example.net_51820-01234567-alice-7-3.conf");
}

void TestMissingValuesRenderUnknown() {
  CredentialRecord bare;
  bare.id = 5;
  assert(FormatFilename("{ipv4_address}_{endpoint}_{batch_id}_{username}_{user_id}_{index}", bare) ==
         "unknown_unknown_unknown_unknown_unknown_1.conf");

  // an empty batch id is the same as none
  bare.request_batch_id = "";
  assert(FormatFilename("{batch_id}", bare) == "unknown.conf");
}

void TestUsernameFallsBackToUserId() {
  assert(FormatFilename("{username}", MakeRecord(), Requester{19, ""}) == "user19.conf");
}

void TestUnsafeBytesAreReplaced() {
  assert(FormatFilename("../{username} files/{id}", MakeRecord(), Requester{1, "bob smith"}) ==
         ".._bob_smith_files_42.conf");
  assert(FormatFilename("{unknown_token}", MakeRecord()) == "{unknown_token}.conf");
}

void TestExtensionAppendedOnce() {
  assert(FormatFilename("peer-{id}.conf", MakeRecord()) == "peer-42.conf");
  assert(FormatFilename("peer-{id}.txt", MakeRecord()) == "peer-42.txt.conf");
  assert(FormatFilename("", MakeRecord()) == ".conf");
}

void TestFilenameContractHolds() {
  const char* patterns[] = {"", "{id}", "x y z", "ümlaut-{username}", "a:b\\c/{endpoint}", "{{id}}", "%s%n"};
  for (const auto* pattern : patterns) {
    const auto name = FormatFilename(pattern, MakeRecord(), Requester{3, "Zoë"}, 9u);
    assert(!name.empty());
    assert(MatchesFilenameContract(name));
  }
}

} // namespace

int main() {
  TestDefaultPattern();
  TestEveryPlaceholder();
  TestMissingValuesRenderUnknown();
  TestUsernameFallsBackToUserId();
  TestUnsafeBytesAreReplaced();
  TestExtensionAppendedOnce();
  TestFilenameContractHolds();

  std::cout << "credpool_unit_naming_engine: pass\n";
  return 0;
}
