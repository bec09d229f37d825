#include "config/PathConfiguration.hpp"
#include "path/PathService.hpp"

#include <doctest/doctest.h>

#include <compare>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

using namespace PK;

namespace {

class NamedFileSystem final : public FileSystem {
public:
    explicit NamedFileSystem(std::string id) : id(std::move(id)) {}
    auto identity() const -> std::string_view override { return id; }

private:
    std::string id;
};

auto makeService(PathConfiguration const& configuration) -> std::unique_ptr<PathService> {
    auto service = PathService::create(configuration);
    REQUIRE(service.has_value());
    return std::move(*service);
}

auto plainService(PathType type, bool equalityUsesCanonicalForm) -> std::unique_ptr<PathService> {
    return std::make_unique<PathService>(std::move(type), NormalizationPipeline{}, NormalizationPipeline{}, equalityUsesCanonicalForm);
}

} // namespace

TEST_SUITE("path.service") {
    TEST_CASE("Names run display then canonical pipeline") {
        auto service = makeService(PathConfiguration::osx());
        auto name    = service->name("CAFE\xCC\x81");
        CHECK(name.display() == "CAF\xC3\x89");
        CHECK(name.canonical() == "cafe\xCC\x81");

        auto names = service->names(std::vector<std::string>{"A", "b"});
        REQUIRE(names.size() == 2);
        CHECK(names[0].canonical() == "a");
        CHECK(names[1].display() == "b");
    }

    TEST_CASE("Factories") {
        auto service = plainService(PathType::posix(), false);

        auto empty = service->emptyPath();
        CHECK_FALSE(empty.isAbsolute());
        CHECK(empty.nameCount() == 1);
        CHECK(empty.names()[0].isEmpty());
        CHECK(empty.isEmptyPath());
        CHECK(empty.toString() == "");

        auto root = service->createRoot(Name::simple("/"));
        CHECK(root.isAbsolute());
        CHECK(root.nameCount() == 0);
        CHECK(root.toString() == "/");

        auto file = service->createFileName(Name::simple("a.txt"));
        CHECK_FALSE(file.isAbsolute());
        CHECK(file.toString() == "a.txt");

        CHECK(service->createRelativePath({}) == empty);
        CHECK(service->createPath(std::nullopt, {}).isEmptyPath());
        CHECK(service->createPath(Name::simple("/"), {Name::simple("x")}).toString() == "/x");
    }

    TEST_CASE("Parsing") {
        auto service = plainService(PathType::posix(), false);

        auto parsed = service->parsePath("/foo/bar");
        REQUIRE(parsed.has_value());
        CHECK(parsed->isAbsolute());
        CHECK(parsed->nameCount() == 2);
        CHECK(parsed->toString() == "/foo/bar");

        auto joined = service->parsePath("", "foo");
        REQUIRE(joined.has_value());
        CHECK(joined->toString() == "foo");
        CHECK_FALSE(joined->isAbsolute());

        auto many = service->parsePath("/usr", std::string{"local"}, "bin");
        REQUIRE(many.has_value());
        CHECK(many->toString() == "/usr/local/bin");

        auto empty = service->parsePath("");
        REQUIRE(empty.has_value());
        CHECK(*empty == service->emptyPath());

        CHECK(service->getSeparator() == "/");
    }

    TEST_CASE("Malformed input propagates") {
        auto service = makeService(PathConfiguration::windows());
        auto parsed  = service->parsePath("C:foo");
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code == Error::Code::MalformedPath);
        CHECK(service->getSeparator() == "\\");
    }

    TEST_CASE("Render reproduces canonical text") {
        auto posix = plainService(PathType::posix(), false);
        for (auto const* text : {"/", "/a", "/a/b/c", "a", "a/b", "../x"}) {
            auto parsed = posix->parsePath(text);
            REQUIRE(parsed.has_value());
            CHECK(parsed->toString() == text);
        }

        auto windows = makeService(PathConfiguration::windows());
        for (auto const* text : {"C:\\", "C:\\a\\b", "\\\\host\\share\\", "\\\\host\\share\\x", "a\\b"}) {
            auto parsed = windows->parsePath(text);
            REQUIRE(parsed.has_value());
            CHECK(parsed->toString() == text);
        }
    }

    TEST_CASE("Display equality mode") {
        auto service = plainService(PathType::posix(), false);
        auto lhs     = service->createFileName(Name::create("foo", "FOO"));
        auto rhs     = service->createFileName(Name::create("foo", "foo"));
        auto other   = service->createFileName(Name::create("FOO", "foo"));

        CHECK(lhs == rhs);
        CHECK(lhs.hash() == rhs.hash());
        CHECK(lhs.compareTo(rhs) == 0);
        CHECK_FALSE(rhs == other);
    }

    TEST_CASE("Canonical equality mode") {
        auto service = plainService(PathType::posix(), true);
        auto lhs     = service->createFileName(Name::create("FOO", "foo"));
        auto rhs     = service->createFileName(Name::create("Foo", "foo"));
        auto other   = service->createFileName(Name::create("foo", "bar"));

        CHECK(lhs == rhs);
        CHECK(lhs.hash() == rhs.hash());
        CHECK_FALSE(lhs == other);
        // Display strings are preserved for rendering.
        CHECK(lhs.toString() == "FOO");
        CHECK(rhs.toString() == "Foo");
    }

    TEST_CASE("Windows preset folds case for equality") {
        auto service = makeService(PathConfiguration::windows());
        auto upper   = service->parsePath("C:\\Dir\\File.TXT");
        auto lower   = service->parsePath("c:/dir/file.txt");
        REQUIRE(upper.has_value());
        REQUIRE(lower.has_value());
        CHECK(*upper == *lower);
        CHECK(upper->hash() == lower->hash());
        CHECK(upper->toString() == "C:\\Dir\\File.TXT");

        std::unordered_set<Path> seen;
        seen.insert(*upper);
        CHECK(seen.contains(*lower));
    }

    TEST_CASE("Ordering") {
        auto service = plainService(PathType::posix(), false);
        auto parse   = [&](std::string_view text) {
            auto parsed = service->parsePath(text);
            REQUIRE(parsed.has_value());
            return *parsed;
        };

        SUBCASE("relative before absolute") {
            CHECK(service->compare(parse("z"), parse("/a")) == -1);
            CHECK(service->compare(parse("/a"), parse("z")) == 1);
        }
        SUBCASE("element-wise then length") {
            CHECK(service->compare(parse("/a/b"), parse("/a/c")) == -1);
            CHECK(service->compare(parse("/a"), parse("/a/b")) == -1);
            CHECK(service->compare(parse("/a/b"), parse("/a")) == 1);
            CHECK(service->compare(parse("a/b"), parse("a/b")) == 0);
        }
        SUBCASE("operators") {
            CHECK(parse("a") < parse("b"));
            CHECK(parse("/a") > parse("b"));
            CHECK(parse("x/y") <= parse("x/y"));
        }
        SUBCASE("hash distinguishes root presence and order") {
            CHECK(parse("/a").hash() != parse("a").hash());
            CHECK(parse("a/b").hash() != parse("b/a").hash());
        }
    }

    TEST_CASE("Hashing ignores the form not selected for equality") {
        auto display = plainService(PathType::posix(), false);
        auto h1      = display->createFileName(Name::create("FOO", "foo")).hash();
        CHECK(display->createFileName(Name::create("FOO", "FOO")).hash() == h1);
        CHECK(display->createFileName(Name::create("FOO", "9874238974897189741")).hash() == h1);

        auto canonical = plainService(PathType::posix(), true);
        auto h2        = canonical->createFileName(Name::create("FOO", "foo")).hash();
        CHECK(canonical->createFileName(Name::create("foo", "foo")).hash() == h2);
        CHECK(canonical->createFileName(Name::create("9874238974897189741", "foo")).hash() == h2);
    }

    TEST_CASE("Comparison follows the selected form") {
        auto build = [](PathService const& service) {
            return std::vector<Path>{service.createFileName(Name::create("a", "z")),
                                     service.createFileName(Name::create("b", "y")),
                                     service.createFileName(Name::create("c", "x"))};
        };

        auto display      = plainService(PathType::posix(), false);
        auto displayPaths = build(*display);
        CHECK(displayPaths[0] < displayPaths[1]);
        CHECK(displayPaths[1] < displayPaths[2]);

        auto canonical      = plainService(PathType::posix(), true);
        auto canonicalPaths = build(*canonical);
        CHECK(canonicalPaths[0] > canonicalPaths[1]);
        CHECK(canonicalPaths[1] > canonicalPaths[2]);
    }

    TEST_CASE("Structured construction") {
        auto service  = plainService(PathType::posix(), false);
        auto relative = service->createRelativePath({service->name("foo"), service->name("bar")});
        CHECK_FALSE(relative.isAbsolute());
        REQUIRE(relative.nameCount() == 2);
        CHECK(relative.nameAt(0)->display() == "foo");
        CHECK(relative.nameAt(1)->display() == "bar");
        CHECK(relative.toString() == "foo/bar");

        auto absolute = service->createPath(service->name("/"), {service->name("foo"), service->name("bar")});
        CHECK(absolute.isAbsolute());
        CHECK(absolute.rootComponent()->display() == "/");
        CHECK(absolute.toString() == "/foo/bar");

        auto windows = makeService(PathConfiguration::windows());
        CHECK(windows->createRelativePath({windows->name("foo"), windows->name("bar")}).toString() == "foo\\bar");
    }

    TEST_CASE("Paths from different services are never equal") {
        auto first  = plainService(PathType::posix(), false);
        auto second = plainService(PathType::posix(), false);
        auto lhs    = first->parsePath("/a");
        auto rhs    = second->parsePath("/a");
        REQUIRE(lhs.has_value());
        REQUIRE(rhs.has_value());
        CHECK_FALSE(*lhs == *rhs);
        CHECK((*lhs <=> *rhs) != std::strong_ordering::equal);
        CHECK((*lhs < *rhs) != (*rhs < *lhs));

        auto same = first->parsePath("/a");
        REQUIRE(same.has_value());
        CHECK((*lhs <=> *same) == std::strong_ordering::equal);
    }

    TEST_CASE("File system binding") {
        auto            service = plainService(PathType::posix(), false);
        NamedFileSystem primary{"primary"};
        NamedFileSystem secondary{"secondary"};

        auto path = service->parsePath("/a");
        REQUIRE(path.has_value());
        CHECK(service->fileSystem() == nullptr);
        CHECK(path->fileSystem() == nullptr);

        REQUIRE(service->setFileSystem(primary).has_value());
        CHECK(service->fileSystem() == &primary);
        CHECK(path->fileSystem() == &primary);
        CHECK(path->fileSystem()->identity() == "primary");

        auto rebound = service->setFileSystem(secondary);
        REQUIRE_FALSE(rebound.has_value());
        CHECK(rebound.error().code == Error::Code::AlreadyBound);
        CHECK(service->fileSystem() == &primary);
    }

    TEST_CASE("Matchers follow the descriptor and case folding") {
        auto posix = plainService(PathType::posix(), false);
        auto glob  = posix->createPathMatcher("glob:*.txt");
        REQUIRE(glob.has_value());
        CHECK(glob->matches("a.txt"));
        CHECK_FALSE(glob->matches("dir/a.txt"));
        CHECK_FALSE(glob->matches("A.TXT"));

        auto unknown = posix->createPathMatcher("foo:bar");
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::UnsupportedSyntax);

        auto windows = makeService(PathConfiguration::windows());
        auto folded  = windows->createPathMatcher("glob:C:/Dir/*.txt");
        REQUIRE(folded.has_value());
        CHECK(folded->matches("c:\\dir\\A.TXT"));
        CHECK(folded->matches("C:/Dir/b.txt"));
    }

    TEST_CASE("Configuration errors surface from create") {
        PathConfiguration configuration;
        configuration.canonicalNormalization = {Normalization::NFC, Normalization::NFD};
        auto service = PathService::create(configuration);
        REQUIRE_FALSE(service.has_value());
        CHECK(service.error().code == Error::Code::InvalidConfiguration);
    }
}
