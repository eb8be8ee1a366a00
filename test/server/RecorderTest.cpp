/* SPDX-License-Identifier: GPL-3.0-only */
#include <string>

#include <gtest/gtest.h>

#include "remux/server/Recorder.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace remux::server;
using remux::message::ReplayEntry;

TEST(Recorder, ConsecutiveDataIsMerged)
{
  Recorder R{80, 24};
  R.recordData("Hello ");
  R.recordData("");
  R.recordData("World");

  ReplayEvent E = R.generateReplay();
  ASSERT_EQ(E.Events.size(), 1);
  EXPECT_EQ(E.Events.front().Data, "Hello World");
  EXPECT_EQ(E.DataSize, 11);
  EXPECT_EQ(E.StartColumns, 80);
  EXPECT_EQ(E.StartRows, 24);
}

TEST(Recorder, ResizeBeforeOutputChangesStart)
{
  Recorder R{80, 24};
  R.recordResize(100, 30);
  EXPECT_EQ(R.eventCount(), 0);
  EXPECT_EQ(R.startColumns(), 100);
  EXPECT_EQ(R.startRows(), 30);
}

TEST(Recorder, ConsecutiveResizesCollapse)
{
  Recorder R{80, 24};
  R.recordData("a");
  R.recordResize(90, 25);
  R.recordResize(120, 40);
  R.recordData("b");

  ReplayEvent E = R.generateReplay();
  ASSERT_EQ(E.Events.size(), 3);
  EXPECT_EQ(E.Events.at(1).Type, ReplayEntry::ResizeEvent);
  EXPECT_EQ(E.Events.at(1).Columns, 120);
  EXPECT_EQ(E.Events.at(1).Rows, 40);
  EXPECT_EQ(E.Events.at(2).Data, "b");
}

TEST(Recorder, OldestOutputDroppedOverCapacity)
{
  Recorder R{80, 24};
  const std::string Half(Recorder::MaxRecordedBytes / 2, 'a');
  R.recordData(Half);
  R.recordResize(100, 50);
  R.recordData(std::string(Recorder::MaxRecordedBytes / 2, 'b'));
  EXPECT_EQ(R.size(), Recorder::MaxRecordedBytes);

  R.recordResize(120, 60);
  R.recordData("cc");
  EXPECT_EQ(R.size(), Recorder::MaxRecordedBytes);

  ReplayEvent E = R.generateReplay();
  ASSERT_EQ(E.Events.size(), 5);
  // Only the front of the first chunk was trimmed.
  EXPECT_EQ(E.Events.front().Data.size(), Half.size() - 2);
  EXPECT_EQ(E.StartColumns, 80);
}

TEST(Recorder, DroppedResizeFoldsIntoStart)
{
  Recorder R{80, 24};
  R.recordData("xyz");
  R.recordResize(100, 50);
  R.recordData(std::string(Recorder::MaxRecordedBytes, 'b'));

  ReplayEvent E = R.generateReplay();
  EXPECT_EQ(E.DataSize, Recorder::MaxRecordedBytes);
  ASSERT_EQ(E.Events.size(), 1);
  EXPECT_EQ(E.Events.front().Type, ReplayEntry::DataEvent);
  EXPECT_EQ(E.StartColumns, 100);
  EXPECT_EQ(E.StartRows, 50);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
