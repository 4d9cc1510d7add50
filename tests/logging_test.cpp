// Tests for the main log.
// Author: Philip Salvaggio

#include "io/logging.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace std;

TEST(LoggingTest, ConcurrentLinesStayWhole) {
  const int kThreads = 4;
  const int kLines = 200;

  testing::internal::CaptureStderr();
  apsim_io::Logging::Init();

  vector<thread> threads;
  for (int t = 0; t < kThreads; t++) {
    threads.emplace_back([t]() {
      for (int i = 0; i < kLines; i++) {
        mainLog() << "Worker " << t << " wrote line " << i << endl;
      }
    });
  }
  for (thread& worker : threads) worker.join();

  string output = testing::internal::GetCapturedStderr();

  vector<int> next_line(kThreads, 0);
  stringstream lines(output);
  string line;
  int count = 0;
  while (getline(lines, line)) {
    int worker = -1, index = -1;
    char rest[2];
    ASSERT_EQ(2, sscanf(line.c_str(), "Worker %d wrote line %d%1s", &worker,
                        &index, rest)) << line;
    ASSERT_GE(worker, 0);
    ASSERT_LT(worker, kThreads);

    // Each thread's lines arrive complete and in order.
    EXPECT_EQ(next_line[worker], index);
    next_line[worker] = index + 1;
    count++;
  }
  EXPECT_EQ(kThreads * kLines, count);
}
