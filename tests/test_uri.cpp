// homecast
// Copyright (C) 2026 The homecast Authors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include "cast/uri.hpp"

#include <QtTest>

using namespace homecast;
using namespace homecast::cast;

class TestUri : public QObject {
  Q_OBJECT

private slots:
  void testParseHttpUrl() {
    Uri uri;

    QVERIFY(!Uri::parse("http://host.example:8080/music/track.mp3?x=1#frag", uri));
    QCOMPARE(uri.scheme(), string("http"));
    QCOMPARE(uri.authority(), string("host.example:8080"));
    QCOMPARE(uri.path(), string("/music/track.mp3"));
    QCOMPARE(uri.query(), string("x=1"));
    QCOMPARE(uri.fragment(), string("frag"));
    QVERIFY(!uri.empty());
  }

  void testDefaultIsEmpty() {
    Uri uri;

    QVERIFY(uri.empty());
    QVERIFY(uri.str().empty());
  }

  void testRejectsMissingScheme() {
    Uri uri;

    QCOMPARE(Uri::parse("//host/path", uri), make_error(err::malformed_uri));
    QCOMPARE(Uri::parse("no-scheme-here", uri), make_error(err::malformed_uri));
    QCOMPARE(Uri::parse("1http://host/", uri), make_error(err::malformed_uri));
    QVERIFY(uri.empty());
  }

  void testRejectsSpacesAndControls() {
    Uri uri;

    QCOMPARE(Uri::parse("http://host/a b.mp3", uri), make_error(err::malformed_uri));
    QCOMPARE(Uri::parse("http://host/a\tb", uri), make_error(err::malformed_uri));
    QCOMPARE(Uri::parse("", uri), make_error(err::malformed_uri));
  }

  void testRejectsBrokenEscapes() {
    Uri uri;

    QCOMPARE(Uri::parse("http://host/a%2", uri), make_error(err::malformed_uri));
    QCOMPARE(Uri::parse("http://host/a%zz", uri), make_error(err::malformed_uri));
    QVERIFY(!Uri::parse("http://host/a%2Fb", uri));
  }

  void testRejectsBadAuthority() {
    Uri uri;

    QCOMPARE(Uri::parse("http://ho\"st/", uri), make_error(err::malformed_uri));
    QCOMPARE(Uri::parse("http://ho<st>/", uri), make_error(err::malformed_uri));
  }

  void testFailedParseLeavesUriUntouched() {
    Uri uri;

    QVERIFY(!Uri::parse("http://first/", uri));
    QVERIFY(Uri::parse("not a uri", uri));
    QCOMPARE(uri.str(), string("http://first/"));
  }

  void testLongUri() {
    Uri uri;
    const auto path = string(200000, 'a');

    QVERIFY(!Uri::parse("https://h/" + path + "?q=" + string(100000, 'b') + "#end", uri));
    QCOMPARE(uri.path(), "/" + path);
    QCOMPARE(uri.query().size(), size_t(100002));
    QCOMPARE(uri.fragment(), string("end"));

    QVERIFY(!Uri::parse(string(100000, 'x') + ":rest", uri));
    QCOMPARE(uri.scheme().size(), size_t(100000));
  }

  void testNoAuthority() {
    Uri uri;

    QVERIFY(!Uri::parse("mailto:someone@example.com", uri));
    QCOMPARE(uri.scheme(), string("mailto"));
    QVERIFY(uri.authority().empty());
    QCOMPARE(uri.path(), string("someone@example.com"));
  }

  void testQueryEscape() {
    QCOMPARE(query_escape("a b&c"), string("a+b%26c"));
    QCOMPARE(query_escape("AZaz09-_.~"), string("AZaz09-_.~"));
    QCOMPARE(query_escape("é"), string("%C3%A9"));
    QCOMPARE(query_escape(""), string());
  }

  void testQueryUnescape() {
    QCOMPARE(query_unescape("a+b%26c"), std::optional<string>("a b&c"));
    QCOMPARE(query_unescape("%C3%A9"), std::optional<string>("é"));
    QVERIFY(!query_unescape("bad%4").has_value());
  }

  void testQueryVal() {
    Uri uri;

    QVERIFY(!Uri::parse("https://h/p?client=tw-ob&q=hello+world%21&flag&tl=en", uri));
    QCOMPARE(uri.query_val("q"), std::optional<string>("hello world!"));
    QCOMPARE(uri.query_val("tl"), std::optional<string>("en"));
    QCOMPARE(uri.query_val("flag"), std::optional<string>(""));
    QVERIFY(!uri.query_val("missing").has_value());
  }
};

QTEST_MAIN(TestUri)
#include "test_uri.moc"
