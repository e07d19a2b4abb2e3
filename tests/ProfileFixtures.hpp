#pragma once

// Trimmed `gluster volume profile vol0 info cumulative` output, two bricks.
inline constexpr const char* kTwoBrickReport =
  "Brick: server1:/bricks/b1\n"
  "-------------------------\n"
  "Cumulative Stats:\n"
  "   Block Size:                  4b+                 512b+ \n"
  " No. of Reads:                    0                     1 \n"
  "No. of Writes:                    3                     0 \n"
  " %-latency   Avg-latency   Min-Latency   Max-Latency   No. of calls         Fop\n"
  " ---------   -----------   -----------   -----------   ------------        ----\n"
  "      0.00       0.00 us       0.00 us       0.00 us              2     RELEASE\n"
  "     12.50     150.00 us      20.00 us     900.00 us             10       WRITE\n"
  "\n"
  "    Duration: 3600 seconds\n"
  "   Data Read: 512 bytes\n"
  "Data Written: 12 bytes\n"
  "\n"
  "Brick: server2:/bricks/b2\n"
  "-------------------------\n"
  "Cumulative Stats:\n"
  " %-latency   Avg-latency   Min-Latency   Max-Latency   No. of calls         Fop\n"
  " ---------   -----------   -----------   -----------   ------------        ----\n"
  "    100.00      75.25 us      11.00 us     300.00 us              4      LOOKUP\n"
  "\n"
  "    Duration: 3600 seconds\n"
  "   Data Read: 0 bytes\n"
  "Data Written: 4096 bytes\n";
