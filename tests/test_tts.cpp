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

#include "cast/tts.hpp"

#include <QtTest>

using namespace homecast;
using namespace homecast::cast;

class TestTts : public QObject {
  Q_OBJECT

private slots:
  void testResolveTemplate() {
    Uri uri;

    QVERIFY(!tts::resolve("hello world", "en", uri));
    QCOMPARE(uri.str(),
             string("https://translate.google.com/translate_tts?client=tw-ob&ie=UTF-8"
                    "&q=hello+world&tl=en"));
  }

  void testResolveEscapesEachValue() {
    Uri uri;

    QVERIFY(!tts::resolve("a b&c", "pt-BR&x", uri));
    QCOMPARE(uri.query_val("q"), std::optional<string>("a b&c"));
    QCOMPARE(uri.query_val("tl"), std::optional<string>("pt-BR&x"));
    QCOMPARE(uri.query_val("client"), std::optional<string>("tw-ob"));
    QCOMPARE(uri.query_val("ie"), std::optional<string>("UTF-8"));
  }

  void testResolveEmptyInputs() {
    Uri uri;

    QVERIFY(!tts::resolve("", "", uri));
    QCOMPARE(uri.query_val("q"), std::optional<string>(""));
    QCOMPARE(uri.query_val("tl"), std::optional<string>(""));
  }

  void testResolveIsDeterministic() {
    Uri a;
    Uri b;

    QVERIFY(!tts::resolve("Dinner is ready", "en", a));
    QVERIFY(!tts::resolve("Dinner is ready", "en", b));
    QVERIFY(a == b);
  }

  void testResolveUnicode() {
    Uri uri;

    QVERIFY(!tts::resolve("olá", "pt", uri));
    QVERIFY(uri.str().find("q=ol%C3%A1") != string::npos);
    QCOMPARE(uri.query_val("q"), std::optional<string>("olá"));
  }

  void testResolveLongText() {
    Uri uri;
    const auto text = string(100000, '!');

    QVERIFY(!tts::resolve(text, "en", uri));
    QCOMPARE(uri.query_val("q"), std::optional<string>(text));
    QCOMPARE(uri.query_val("tl"), std::optional<string>("en"));
  }

  void testResolveCustomHost() {
    Uri uri;

    QVERIFY(!tts::resolve("tts.local:8080", "hi", "en", uri));
    QCOMPARE(uri.authority(), string("tts.local:8080"));
    QCOMPARE(uri.path(), string("/translate_tts"));
  }

  void testResolveBadHost() {
    Uri uri;

    QCOMPARE(tts::resolve("bad host", "hi", "en", uri), make_error(err::malformed_uri));
    QCOMPARE(tts::resolve("bad\"host", "hi", "en", uri), make_error(err::malformed_uri));
    QVERIFY(uri.empty());
  }
};

QTEST_MAIN(TestTts)
#include "test_tts.moc"
