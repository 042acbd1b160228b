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

#include "cast/content.hpp"
#include "fakes.hpp"

#include <QtTest>

using namespace homecast;
using namespace homecast::cast;
using homecast::test::make_uri;

class TestContent : public QObject {
  Q_OBJECT

private slots:
  void testSingleHasNoMetadata() {
    const auto item = content::single(make_uri("http://h/a.mp3"));

    QCOMPARE(item.content_id, string("http://h/a.mp3"));
    QCOMPARE(item.content_type, string("audio/mp3"));
    QCOMPARE(item.stream_type, string("BUFFERED"));
    QVERIFY(!item.metadata.has_value());
  }

  void testManyPreservesOrderAndTitles() {
    const PlayableItems items{{.uri = make_uri("http://h/a.mp3"), .title = "A"},
                              {.uri = make_uri("http://h/b.mp3"), .title = "B"}};

    const auto media = content::many(items);

    QCOMPARE(media.size(), size_t(2));
    QCOMPARE(media[0].content_id, string("http://h/a.mp3"));
    QCOMPARE(media[1].content_id, string("http://h/b.mp3"));

    QVERIFY(media[0].metadata.has_value());
    QCOMPARE(media[0].metadata->type, content::metadata_type);
    QCOMPARE(media[0].metadata->title, string("A"));
    QCOMPARE(media[1].metadata->title, string("B"));
  }

  void testManyMissingTitleIsEmpty() {
    const PlayableItems items{{.uri = make_uri("http://h/x.mp3"), .title = std::nullopt}};

    const auto media = content::many(items);

    QCOMPARE(media.size(), size_t(1));
    QVERIFY(media[0].metadata.has_value());
    QCOMPARE(media[0].metadata->type, 3);
    QVERIFY(media[0].metadata->title.empty());
    QCOMPARE(media[0].content_type, string(content::type));
    QCOMPARE(media[0].stream_type, string(content::stream));
  }

  void testManyEmpty() { QVERIFY(content::many(PlayableItems{}).empty()); }
};

QTEST_MAIN(TestContent)
#include "test_content.moc"
