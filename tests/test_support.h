#ifndef MENU_TREE_TEST_SUPPORT_H
#define MENU_TREE_TEST_SUPPORT_H

#include <string>
#include <vector>

#include "MenuTree.h"

/* Key sequences as a terminal delivers them in one read */
static const char *const KEY_UP    = "\x1b[A";
static const char *const KEY_DOWN  = "\x1b[B";
static const char *const KEY_RIGHT = "\x1b[C";
static const char *const KEY_LEFT  = "\x1b[D";
static const char *const KEY_ENTER = "\r";
static const char *const KEY_ESC   = "\x1b";
static const char *const KEY_TICK  = "`";
static const char *const KEY_EXIT  = "x";

/* Each entry is the payload of one read. Running out of entries is a read failure. */
struct scripted_term_t {
    std::vector<std::string> reads;
    size_t next;
    int    raw_enters;
    int    raw_restores;
    int    raw_depth;
    int    max_raw_depth;
    bool   fail_raw;

    scripted_term_t() : next(0), raw_enters(0), raw_restores(0), raw_depth(0), max_raw_depth(0), fail_raw(false) { }

    scripted_term_t &key(const char *bytes) { reads.push_back(bytes); return *this; }

    size_t remaining() const { return reads.size() - next; }

    static bool raw_enter(void *ctx) {
        scripted_term_t &t = *static_cast<scripted_term_t *>(ctx);
        if (t.fail_raw) { return false; }
        t.raw_enters++;
        t.raw_depth++;
        if (t.raw_depth > t.max_raw_depth) { t.max_raw_depth = t.raw_depth; }
        return true;
    }

    static void raw_restore(void *ctx) {
        scripted_term_t &t = *static_cast<scripted_term_t *>(ctx);
        t.raw_restores++;
        t.raw_depth--;
    }

    static int read(void *ctx, uint8_t *buf, uint8_t cap) {
        scripted_term_t &t = *static_cast<scripted_term_t *>(ctx);
        if (t.next >= t.reads.size()) { return -1; }
        const std::string &r = t.reads[t.next++];
        size_t n = r.size() < cap ? r.size() : cap;
        memcpy(buf, r.data(), n);
        return (int)n;
    }

    term_source_t source() {
        static term_ops_t const ops = { &scripted_term_t::raw_enter, &scripted_term_t::raw_restore, &scripted_term_t::read };
        term_source_t s; s.ctx = this; s.ops = &ops; return s;
    }
};

struct capture_output_t {
    std::string text;
    int flushes;

    capture_output_t() : flushes(0) { }

    static void write(void *ctx, char const *t) { static_cast<capture_output_t *>(ctx)->text += t; }
    static void flush(void *ctx) { static_cast<capture_output_t *>(ctx)->flushes++; }

    output_t sink() { output_t o; o.ctx = this; o.write = &capture_output_t::write; o.flush = &capture_output_t::flush; return o; }

    bool contains(const std::string &needle) const { return text.find(needle) != std::string::npos; }

    size_t count(const std::string &needle) const {
        size_t n = 0;
        for (size_t at = text.find(needle); at != std::string::npos; at = text.find(needle, at + needle.size())) { ++n; }
        return n;
    }
};

/* Records option names instead of running them. */
struct recording_runner_t {
    std::vector<std::string> calls;

    static void run(void *ctx, menu_option_t const &option) { static_cast<recording_runner_t *>(ctx)->calls.push_back(option.name); }

    action_runner_t runner() { action_runner_t r; r.ctx = this; r.run = &recording_runner_t::run; return r; }
};

static inline void noop_action() { }

#endif /* MENU_TREE_TEST_SUPPORT_H */
