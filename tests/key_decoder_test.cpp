#include <gtest/gtest.h>

#include "test_support.h"

namespace {

key_event_t decode(const char *bytes, int n) { return decode_keys(reinterpret_cast<const uint8_t *>(bytes), n); }

TEST(KeyDecoder, ArrowSequencesUseOnlyTheLastByte) {
    EXPECT_EQ(Cmd_Up,    decode("\x1b[A", 3).cmd);
    EXPECT_EQ(Cmd_Down,  decode("\x1b[B", 3).cmd);
    EXPECT_EQ(Cmd_Enter, decode("\x1b[C", 3).cmd);
    EXPECT_EQ(Cmd_Back,  decode("\x1b[D", 3).cmd);
    EXPECT_EQ(Cmd_Up,    decode("zzA", 3).cmd);
}

TEST(KeyDecoder, UnknownThreeByteSequenceFallsBackToDown) {
    EXPECT_EQ(Cmd_Down, decode("\x1b[F", 3).cmd);
    EXPECT_EQ(Cmd_Down, decode("\x1bOP", 3).cmd);
}

TEST(KeyDecoder, SingleBytes) {
    EXPECT_EQ(Cmd_Enter,  decode("\r", 1).cmd);
    EXPECT_EQ(Cmd_Back,   decode("\x1b", 1).cmd);
    EXPECT_EQ(Cmd_Toggle, decode("`", 1).cmd);
    EXPECT_EQ(Cmd_Exit,   decode("x", 1).cmd);
    EXPECT_EQ(Cmd_Exit,   decode("\x03", 1).cmd);
}

TEST(KeyDecoder, OtherBytesAreLiterals) {
    key_event_t ev = decode("b", 1);
    EXPECT_EQ(Cmd_Literal, ev.cmd);
    EXPECT_EQ('b', ev.literal);

    ev = decode("X", 1);   // only lower-case x exits
    EXPECT_EQ(Cmd_Literal, ev.cmd);
    EXPECT_EQ('X', ev.literal);

    ev = decode("\n", 1);
    EXPECT_EQ(Cmd_Literal, ev.cmd);
}

TEST(KeyDecoder, TwoBytesAreJudgedByTheFirst) {
    EXPECT_EQ(Cmd_Back, decode("\x1b" "a", 2).cmd);
    EXPECT_EQ(Cmd_Literal, decode("ab", 2).cmd);
}

TEST(KeyDecoder, EmptyAndFailedReads) {
    EXPECT_EQ(Cmd_Empty, decode("", 0).cmd);
    EXPECT_EQ(Cmd_Fail, decode("", -1).cmd);
}

TEST(KeyDecoder, ReadCommandHoldsRawModeForTheReadOnly) {
    scripted_term_t term;
    term.key(KEY_UP).key("q");
    term_source_t src = term.source();

    EXPECT_EQ(Cmd_Up, read_command(src).cmd);
    EXPECT_EQ(1, term.raw_enters);
    EXPECT_EQ(1, term.raw_restores);
    EXPECT_EQ(0, term.raw_depth);

    key_event_t ev = read_command(src);
    EXPECT_EQ(Cmd_Literal, ev.cmd);
    EXPECT_EQ('q', ev.literal);
    EXPECT_EQ(2, term.raw_restores);
    EXPECT_EQ(1, term.max_raw_depth);
}

TEST(KeyDecoder, FailedReadStillRestoresTheTerminal) {
    scripted_term_t term;
    term_source_t src = term.source();

    EXPECT_EQ(Cmd_Fail, read_command(src).cmd);
    EXPECT_EQ(1, term.raw_enters);
    EXPECT_EQ(1, term.raw_restores);
}

TEST(KeyDecoder, RawModeFailureIsFatalAndSkipsTheRead) {
    scripted_term_t term;
    term.key(KEY_ENTER);
    term.fail_raw = true;
    term_source_t src = term.source();

    EXPECT_EQ(Cmd_Fail, read_command(src).cmd);
    EXPECT_EQ(0, term.raw_restores);
    EXPECT_EQ(1u, term.remaining());
}

TEST(KeyDecoder, SourceWithoutReadFails) {
    static term_ops_t const no_read = { 0, 0, 0 };
    term_source_t src; src.ctx = 0; src.ops = &no_read;
    EXPECT_EQ(Cmd_Fail, read_command(src).cmd);

    src.ops = 0;
    EXPECT_EQ(Cmd_Fail, read_command(src).cmd);
}

}  // namespace
