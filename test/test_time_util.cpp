#include <cassert>
#include <cstdio>
#include <cmath>
#include "util/TimeUtil.h"

void test_seconds_to_hms() {
    QString result = TimeUtil::secondsToHMS(3661.5);
    assert(result == "1:01:01.500");
    assert(TimeUtil::secondsToHMS(65.25) == "1:05.250");
    printf("PASS: test_seconds_to_hms\n");
}

void test_format_seconds() {
    assert(TimeUtil::formatSeconds(12.5) == "12.500000");
    assert(TimeUtil::formatSeconds(-1.0) == "0.000000");
    printf("PASS: test_format_seconds\n");
}

void test_format_number() {
    assert(TimeUtil::formatNumber(30.0) == "30");
    assert(TimeUtil::formatNumber(0.5) == "0.5");
    assert(TimeUtil::formatNumber(29.97) == "29.97");
    printf("PASS: test_format_number\n");
}

void test_parse_encoder_time() {
    QString line = "frame=  120 fps= 60 q=28.0 size=     512kB time=00:00:04.00 bitrate=1048.6kbits/s speed=2.0x";
    assert(std::abs(TimeUtil::parseEncoderTime(line) - 4.0) < 1e-9);

    // Several status lines in one read: the last one wins
    QString chunk = "time=00:00:01.50 bitrate=1k\rtime=00:01:02.25 bitrate=1k\r";
    assert(std::abs(TimeUtil::parseEncoderTime(chunk) - 62.25) < 1e-9);

    assert(TimeUtil::parseEncoderTime("Press [q] to stop") < 0.0);
    printf("PASS: test_parse_encoder_time\n");
}

void test_parse_split_status_line() {
    // "time=" cut between two reads: only complete lines count
    QByteArray buffer = "frame=  30 time=00:00:01.00 bitrate=1k\rframe=  60 ti";
    assert(std::abs(TimeUtil::parseLatestEncoderTime(buffer) - 1.0) < 1e-9);

    buffer += "me=00:00:02.00 bitrate=1k\r";
    assert(std::abs(TimeUtil::parseLatestEncoderTime(buffer) - 2.0) < 1e-9);

    assert(TimeUtil::parseLatestEncoderTime("frame=  10 time=00:00:00.5") < 0.0);
    assert(TimeUtil::parseLatestEncoderTime(QByteArray()) < 0.0);
    printf("PASS: test_parse_split_status_line\n");
}

int main() {
    test_seconds_to_hms();
    test_format_seconds();
    test_format_number();
    test_parse_encoder_time();
    test_parse_split_status_line();
    printf("All time util tests passed.\n");
    return 0;
}
