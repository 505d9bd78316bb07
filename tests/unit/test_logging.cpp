#include <catch2/catch_test_macros.hpp>

#include "app/logging.hpp"
#include "support/test_support.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace lanlink::app;
using lanlink::test::read_file;
using lanlink::test::write_file;

TEST_CASE("rotate_log_file: small files stay in place", "[app][logging]") {
    QTemporaryDir dir;
    const auto path = dir.filePath(QStringLiteral("lanlink.log"));
    write_file(path, QByteArray(100, 'a'));

    REQUIRE_FALSE(rotate_log_file(path, 1024));
    REQUIRE(QFile::exists(path));
    REQUIRE_FALSE(QFile::exists(path + QStringLiteral(".1")));
}

TEST_CASE("rotate_log_file: oversized file replaces the previous backup", "[app][logging]") {
    QTemporaryDir dir;
    const auto path = dir.filePath(QStringLiteral("lanlink.log"));
    write_file(path + QStringLiteral(".1"), QByteArrayLiteral("old backup"));
    write_file(path, QByteArray(2048, 'b'));

    REQUIRE(rotate_log_file(path, 1024));
    REQUIRE_FALSE(QFile::exists(path));
    REQUIRE(read_file(path + QStringLiteral(".1")) == QByteArray(2048, 'b'));
}

TEST_CASE("rotate_log_file: missing file or disabled limit is a no-op", "[app][logging]") {
    QTemporaryDir dir;
    const auto path = dir.filePath(QStringLiteral("absent.log"));
    REQUIRE_FALSE(rotate_log_file(path, 10));

    write_file(path, QByteArray(64, 'c'));
    REQUIRE_FALSE(rotate_log_file(path, 0));
}

TEST_CASE("default_log_file_path: lives under a logs directory", "[app][logging]") {
    const auto path = default_log_file_path();
    REQUIRE_FALSE(path.isEmpty());
    REQUIRE(path.endsWith(QStringLiteral("logs/lanlink.log")));
}
