#include "ModuleRecord.hh"
#include "TestSupport.hh"
#include "Uuid.hh"
#include "sha256.hh"

namespace
{
using namespace testsupport;

bool MetadataKnownFieldsAndExtras()
{
    ModuleMetadata m = ParseMetadata(R"({"sourceName":"Weather","scriptURL":"https://cdn/w.js","version":"3.1","region":"eu","limits":{"rpm":30}})");
    bool ok = ExpectEqual(m.SourceName, std::string("Weather"), "source name");
    ok &= ExpectEqual(m.ScriptURL, std::string("https://cdn/w.js"), "script url");
    ok &= ExpectEqual(m.Version, std::string("3.1"), "version");
    ok &= ExpectEqual(m.Extra.size(), std::size_t(2), "two extra fields");
    ok &= ExpectTrue(m.Extra["limits"]["rpm"] == 30, "nested extra kept verbatim");

    json back = MetadataToJSON(m);
    ok &= ExpectTrue(back["region"] == "eu" && back["sourceName"] == "Weather", "extras and known fields written back");
    return ok;
}

bool MetadataKeysMatchCaseInsensitively()
{
    ModuleMetadata m = ParseMetadata(R"({"SourceName":"A","SCRIPTURL":"http://x/s","Version":"2"})");
    bool ok = ExpectEqual(m.SourceName, std::string("A"), "capitalised source name");
    ok &= ExpectEqual(m.ScriptURL, std::string("http://x/s"), "upper-case script url");
    ok &= ExpectEqual(m.Version, std::string("2"), "capitalised version");
    ok &= ExpectTrue(m.Extra.empty(), "case variants are not extras");

    ModuleMetadata exact = ParseMetadata(R"({"Version":"old","version":"new"})");
    ok &= ExpectEqual(exact.Version, std::string("new"), "exact key wins");
    return ok;
}

bool MetadataNullsAndMissingFieldsAreEmpty()
{
    ModuleMetadata m = ParseMetadata(R"({"sourceName":null})");
    bool ok = ExpectTrue(m.SourceName.empty() && m.ScriptURL.empty() && m.Version.empty(), "zero values");
    ok &= ExpectRegistryError([]() { ParseMetadata("null"); }, ErrorCode::ParseError, "null document");
    ok &= ExpectRegistryError([]() { ParseMetadata(""); }, ErrorCode::ParseError, "empty body");
    ok &= ExpectRegistryError([]() { ParseMetadata(R"({"scriptURL":["a"]})"); }, ErrorCode::ParseError, "array script url");
    return ok;
}

bool RecordDecodingIsStrictAboutIdentity()
{
    const std::string id = GenerateUuid();
    json good = {{"id", id}, {"metadata", {{"sourceName", "A"}, {"scriptURL", "u"}, {"version", "1"}}}, {"localPath", "f.js"}, {"metadataURL", "m"}};
    ModuleRecord r = RecordFromJSON(good);
    bool ok = ExpectEqual(r.ID, id, "id kept");
    ok &= ExpectTrue(!r.IsActive && r.ScriptSha256.empty(), "optional fields default");
    ok &= ExpectEqual(r.Metadata.SourceName, std::string("A"), "nested metadata decoded");

    json badId = good;
    badId["id"] = "module-1";
    ok &= ExpectRegistryError([&]() { RecordFromJSON(badId); }, ErrorCode::ParseError, "non-uuid id");

    json badFlag = good;
    badFlag["isActive"] = "yes";
    ok &= ExpectRegistryError([&]() { RecordFromJSON(badFlag); }, ErrorCode::ParseError, "non-bool active flag");

    ok &= ExpectTrue(RecordsFromJSON(json(nullptr)).empty(), "null list is empty");
    ok &= ExpectRegistryError([]() { RecordsFromJSON(json::object()); }, ErrorCode::ParseError, "object instead of list");
    return ok;
}

bool RecordEncodingKeepsExtrasAndChecksum()
{
    ModuleRecord r;
    r.ID = GenerateUuid();
    r.Metadata = ParseMetadata(R"({"sourceName":"Weather","scriptURL":"u","version":"2","region":"eu"})");
    r.LocalPath = r.ID + ".js";
    r.MetadataURL = "http://x/meta";
    r.ScriptSha256 = sha256("body");

    json j = RecordToJSON(r);
    bool ok = ExpectTrue(j["metadata"]["region"] == "eu", "extra metadata field exported");
    ok &= ExpectTrue(j["scriptSha256"] == sha256("body"), "checksum exported");
    ok &= ExpectTrue(j["isActive"] == false, "active flag exported");

    ModuleRecord back = RecordFromJSON(j);
    ok &= ExpectTrue(back.Metadata.Extra == r.Metadata.Extra && back.ScriptSha256 == r.ScriptSha256, "decoded record matches");
    return ok;
}

bool UuidHelpers()
{
    const std::string a = GenerateUuid();
    const std::string b = GenerateUuid();
    bool ok = ExpectTrue(a != b, "fresh identifiers differ");
    ok &= ExpectEqual(a.size(), std::size_t(36), "canonical length");
    ok &= ExpectEqual(a[14], '4', "random version");

    auto normalized = NormalizeUuid("3F2504E0-4F89-11D3-9A0C-0305E82C3301");
    ok &= ExpectTrue(normalized.has_value(), "upper-case uuid parses");
    ok &= ExpectEqual(normalized.value_or(""), std::string("3f2504e0-4f89-11d3-9a0c-0305e82c3301"), "lower-cased");
    ok &= ExpectTrue(!NormalizeUuid("3f2504e0").has_value(), "short text rejected");
    ok &= ExpectTrue(!NormalizeUuid("").has_value(), "empty text rejected");
    return ok;
}

bool Sha256Digest()
{
    bool ok = ExpectEqual(sha256("abc"), std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"), "known vector");
    ok &= ExpectEqual(sha256(""), std::string("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"), "empty input");
    ok &= ExpectTrue(sha256(std::string("a\0b", 3)) != sha256("a"), "embedded nul bytes are hashed");
    return ok;
}

} // namespace

int main()
{
    std::vector<TestCase> tests{
        {"MetadataKnownFieldsAndExtras", MetadataKnownFieldsAndExtras},
        {"MetadataKeysMatchCaseInsensitively", MetadataKeysMatchCaseInsensitively},
        {"MetadataNullsAndMissingFieldsAreEmpty", MetadataNullsAndMissingFieldsAreEmpty},
        {"RecordDecodingIsStrictAboutIdentity", RecordDecodingIsStrictAboutIdentity},
        {"RecordEncodingKeepsExtrasAndChecksum", RecordEncodingKeepsExtrasAndChecksum},
        {"UuidHelpers", UuidHelpers},
        {"Sha256Digest", Sha256Digest},
    };
    return testsupport::RunTests(tests);
}
