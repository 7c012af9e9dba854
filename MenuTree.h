/*\
|*| MenuTree.h
|*|
|*| Nested, keyboard-navigable menus for interactive command line tools.
|*| Two entry kinds: options (named callbacks) and submenus (child menus).
|*| Hotkeys are assigned at render time; menus redraw themselves in place.
|*|
|*| Blocking: menu_session_t::display() owns the terminal until the user exits.
|*| Pluggable collaborators: terminal source, output sink, action runner.
|*| Built-ins: POSIX tty raw-mode reader, stdout writer.
|*|
|*| (c) 2022-2025 Trent M. Wyatt.
\*/

#ifndef MENU_TREE_H
#define MENU_TREE_H

#include <stddef.h>
#include <stdint.h>
#include <string.h>

#if defined(__unix__) || defined(__APPLE__)
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <termios.h>
#include <unistd.h>
#endif

/* ============================= Configuration ============================= */

#ifndef MENU_TREE_MAX_OPTIONS
#define MENU_TREE_MAX_OPTIONS 16
#endif

#ifndef MENU_TREE_MAX_LINKS
#define MENU_TREE_MAX_LINKS 32
#endif

#ifndef MENU_TREE_MAX_LINE
#define MENU_TREE_MAX_LINE 160
#endif

#ifndef MENU_TREE_MAX_LINES
#define MENU_TREE_MAX_LINES 80
#endif

#ifndef MENU_TREE_MAX_PROMPT
#define MENU_TREE_MAX_PROMPT 512
#endif

#if (MENU_TREE_MAX_OPTIONS + MENU_TREE_MAX_LINKS) >= 255
#error "MENU_TREE_MAX_OPTIONS + MENU_TREE_MAX_LINKS must stay below 255"
#endif

#if MENU_TREE_MAX_LINES > 250
#error "MENU_TREE_MAX_LINES must not exceed 250"
#endif

#if MENU_TREE_MAX_LINES < (MENU_TREE_MAX_OPTIONS + MENU_TREE_MAX_LINKS + 6)
#error "MENU_TREE_MAX_LINES must hold every item line plus headings, a prompt line and the footer"
#endif

#define MENU_TREE_EXIT_KEY  'X'     /* reserved, never handed out as a hotkey */
#define MENU_TREE_NO_HOTKEY 0xFF

/* =============================== Input API =============================== */

enum command_t : uint8_t {
    Cmd_Empty = 0,
    Cmd_Up,
    Cmd_Down,
    Cmd_Back,
    Cmd_Enter,
    Cmd_Toggle,
    Cmd_Exit,
    Cmd_Literal,
    Cmd_Fail
};

/* Raw key bytes. Arrow keys arrive as ESC '[' <final>; only <final> is looked at. */
enum {
    MK_CTRL_C   = 3,
    MK_ENTER    = 13,
    MK_ESCAPE   = 27,
    MK_UP       = 65,
    MK_DOWN     = 66,
    MK_RIGHT    = 67,
    MK_LEFT     = 68,
    MK_BACKTICK = 96,
    MK_EXIT     = 120
};

struct key_event_t { command_t cmd; char literal; };

/* Terminal collaborator. raw_enter/raw_restore bracket every single read; both may be 0.
   read() blocks and returns the number of bytes read, or -1 on failure. */
struct term_ops_t {
    bool (*raw_enter)(void *ctx);
    void (*raw_restore)(void *ctx);
    int  (*read)(void *ctx, uint8_t *buf, uint8_t cap);
};

struct term_source_t {
    void *ctx;
    term_ops_t const *ops;
};

/* ============================== Output API =============================== */

typedef void (*output_write_fptr_t)(void *ctx, char const *text);
typedef void (*output_flush_fptr_t)(void *ctx);

struct output_t {
    void                *ctx;
    output_write_fptr_t  write;
    output_flush_fptr_t  flush;   /* optional; may be 0 */
};

/* ================================ Styling ================================ */

enum style_t : uint8_t { STYLE_BOLD = 0, STYLE_ITALIC = 1, STYLE_UNDERLINE = 2 };

static char const *const STYLE_ON[]  = { "\033[1m",  "\033[3m",  "\033[4m"  };
static char const *const STYLE_OFF[] = { "\033[22m", "\033[23m", "\033[24m" };

/* ============================ String helpers ============================= */

static inline char *int_to_str(int v, char *buf, uint8_t cap) {
    if (cap == 0) { return buf; }
    char tmp[12]; uint8_t i = 0; bool neg = v < 0; unsigned int uv = neg ? (unsigned int)(-v) : (unsigned int)v;
    do { tmp[i++] = (char)('0' + (uv % 10U)); uv /= 10U; } while (uv && i < sizeof(tmp));
    uint8_t pos = 0; if (neg && pos < cap - 1) { buf[pos++] = '-'; }
    while (i && pos < cap - 1) { buf[pos++] = tmp[--i]; } buf[pos] = '\0'; return buf;
}

static inline void append_n(char *dst, size_t cap, char const *src, size_t n) {
    size_t len = strlen(dst); if (len >= cap) { if (cap) dst[cap - 1] = '\0'; return; }
    while (n && *src && len < cap - 1) { dst[len++] = *src++; --n; } dst[len] = '\0';
}

static inline void append_capped(char *dst, size_t cap, char const *src) { append_n(dst, cap, src, (size_t)-1); }

static inline void append_fill(char *dst, size_t cap, char ch, int count) {
    size_t len = strlen(dst);
    while (count-- > 0 && len + 1 < cap) { dst[len++] = ch; } if (cap) { dst[len < cap ? len : cap - 1] = '\0'; }
}

static inline void append_styled(char *dst, size_t cap, char const *text, style_t st, bool styled) {
    if (styled) { append_capped(dst, cap, STYLE_ON[st]); }
    append_capped(dst, cap, text);
    if (styled) { append_capped(dst, cap, STYLE_OFF[st]); }
}

/* Printed columns: CSI sequences take none, UTF-8 continuation bytes share their lead's column. */
static inline uint16_t visible_width(char const *s) {
    uint16_t w = 0;
    while (*s) {
        unsigned char const c = (unsigned char)*s;
        if (c == 0x1B && s[1] == '[') {
            s += 2; while (*s && !(*s >= 0x40 && *s <= 0x7E)) { ++s; } if (*s) { ++s; } continue;
        }
        if ((c & 0xC0) != 0x80) { ++w; }
        ++s;
    }
    return w;
}

/* In place: every non-overlapping "ab" becomes '\n', scanning left to right. */
static inline void collapse_pair(char *s, char a, char b) {
    char *w = s;
    for (char const *r = s; *r; ) {
        if (r[0] == a && r[1] == b) { *w++ = '\n'; r += 2; } else { *w++ = *r++; }
    }
    *w = '\0';
}

static inline unsigned char upper_ascii(unsigned char c) { return (c >= 'a' && c <= 'z') ? (unsigned char)(c - 'a' + 'A') : c; }

/* ============================== Menu Entities ============================ */

typedef void (*menu_action_fptr_t)();

/* The returned text must stay valid until the provider is called again. */
typedef char const * (*menu_prompt_fptr_t)();

struct menu_option_t { char const *name; menu_action_fptr_t fn; };

/* Names and static prompts are borrowed and must outlive the menu. */
struct menu_node_t {
    char const         *name;
    char const         *prompt;          /* static text, or the provider's last result */
    menu_prompt_fptr_t  prompt_fn;       /* takes precedence over prompt when set */
    menu_option_t       options[MENU_TREE_MAX_OPTIONS];   /* display and selection order */
    uint8_t             option_count;
    uint8_t             hot_keys[128];   /* upper-cased key -> item index, rebuilt every render */
    uint8_t             selection;
    uint8_t             last_render_lines;
    uint16_t            longest_line;

    menu_node_t(char const *n, char const *p, menu_prompt_fptr_t fn = 0)
        : name(n ? n : ""), prompt(""), prompt_fn(0), options(), option_count(0),
          selection(0), last_render_lines(0), longest_line(0) {
        set_prompt(p, fn);
        clear_hot_keys();
    }

    inline void set_prompt(char const *p, menu_prompt_fptr_t fn) {
        if (fn) { prompt = ""; prompt_fn = fn; }
        else    { prompt = p ? p : ""; prompt_fn = 0; }
    }

    /* Evaluates the provider (if any) exactly once and remembers its text. */
    inline char const *resolve_prompt() {
        if (prompt_fn) { char const *p = prompt_fn(); prompt = p ? p : ""; }
        return prompt;
    }

    inline int find_option(char const *n) const {
        if (!n) { return -1; }
        for (uint8_t i = 0; i < option_count; ++i) { if (strcmp(options[i].name, n) == 0) { return i; } }
        return -1;
    }

    /* Last binding wins; an existing name moves to the end of the order. False when full. */
    inline bool add_option(char const *n, menu_action_fptr_t fn) {
        if (!n) { return false; }
        int const at = find_option(n);
        if (at < 0 && option_count >= MENU_TREE_MAX_OPTIONS) { return false; }
        if (at >= 0) { remove_at((uint8_t)at); }
        options[option_count].name = n;
        options[option_count].fn   = fn;
        option_count++;
        return true;
    }

    inline bool delete_option(char const *n) {
        int const at = find_option(n);
        if (at < 0) { return false; }
        remove_at((uint8_t)at);
        return true;
    }

    inline void clear_hot_keys() { memset(hot_keys, MENU_TREE_NO_HOTKEY, sizeof(hot_keys)); }

    inline int hot_key_index(char key) const {
        unsigned char const k = upper_ascii((unsigned char)key);
        if (k >= sizeof(hot_keys) || hot_keys[k] == MENU_TREE_NO_HOTKEY) { return -1; }
        return hot_keys[k];
    }

    /* Claims the first free key in n for item idx and returns the byte offset of the
       character it came from, or -1 if every candidate is taken. Only printable
       ASCII (space included) qualifies; the exit key is always skipped. */
    inline int assign_hot_key(char const *n, uint8_t idx) {
        for (int i = 0; n[i]; ++i) {
            unsigned char const ch = (unsigned char)n[i];
            if (ch < ' ' || ch >= 0x7F) { continue; }
            unsigned char const up = upper_ascii(ch);
            if (up == MENU_TREE_EXIT_KEY) { continue; }
            if (hot_keys[up] == MENU_TREE_NO_HOTKEY) { hot_keys[up] = idx; return i; }
        }
        return -1;
    }

private:
    inline void remove_at(uint8_t idx) {
        for (uint8_t i = idx; i + 1 < option_count; ++i) { options[i] = options[i + 1]; }
        option_count--;
    }
};

/* =============================== Menu Graph ============================== */

struct menu_link_t { menu_node_t *parent; menu_node_t *child; };

/* Children of a parent are its links in insertion order. Menus know neither. */
struct menu_graph_t {
    menu_node_t *home;
    menu_node_t *current;
    menu_node_t *previous;   /* single slot, 0 on the home menu */
    menu_link_t  links[MENU_TREE_MAX_LINKS];
    uint8_t      link_count;

    explicit menu_graph_t(menu_node_t &h) : home(&h), current(&h), previous(0), links(), link_count(0) { }

    inline char const *name() const   { return current->name; }
    inline char const *prompt() const { return current->prompt; }

    inline bool add_submenu(menu_node_t &parent, menu_node_t &child) {
        if (link_count >= MENU_TREE_MAX_LINKS) { return false; }
        links[link_count].parent = &parent;
        links[link_count].child  = &child;
        link_count++;
        return true;
    }

    /* All or nothing: nothing is linked if a child is null or they do not all fit. */
    inline bool add_submenus(menu_node_t &parent, menu_node_t *const *children, uint8_t n) {
        if (n && !children) { return false; }
        if ((unsigned)link_count + n > MENU_TREE_MAX_LINKS) { return false; }
        for (uint8_t i = 0; i < n; ++i) { if (!children[i]) { return false; } }
        for (uint8_t i = 0; i < n; ++i) { add_submenu(parent, *children[i]); }
        return true;
    }

    template<size_t N>
    inline bool add_submenus(menu_node_t &parent, menu_node_t *(&children)[N]) { return add_submenus(parent, children, (uint8_t)N); }

    inline bool delete_submenu(menu_node_t &parent, menu_node_t &child) {
        for (uint8_t i = 0; i < link_count; ++i) {
            if (links[i].parent == &parent && links[i].child == &child) {
                for (uint8_t j = i; j + 1 < link_count; ++j) { links[j] = links[j + 1]; }
                link_count--;
                return true;
            }
        }
        return false;
    }

    inline uint8_t submenu_count(menu_node_t const &parent) const {
        uint8_t n = 0;
        for (uint8_t i = 0; i < link_count; ++i) { if (links[i].parent == &parent) { ++n; } }
        return n;
    }

    inline menu_node_t *submenu_at(menu_node_t const &parent, uint8_t idx) const {
        for (uint8_t i = 0; i < link_count; ++i) {
            if (links[i].parent != &parent) { continue; }
            if (idx == 0) { return links[i].child; }
            --idx;
        }
        return 0;
    }

    inline uint8_t item_count(menu_node_t const &m) const { return (uint8_t)(m.option_count + submenu_count(m)); }

    /* Bookkeeping half of a menu change: the owning session re-renders. */
    inline void change_menu(menu_node_t &target) {
        previous = current;
        if (&target == home) { previous = 0; }
        current = &target;
        current->last_render_lines = 0;
    }
};

/* =============================== Rendering =============================== */

struct menu_frame_t {
    char     lines[MENU_TREE_MAX_LINES][MENU_TREE_MAX_LINE];
    uint8_t  count;
    uint16_t longest;   /* widest visible line + 2 */

    /* The last two slots are kept for the separator and the footer. */
    inline char *next_line(bool tail = false) {
        uint8_t const limit = tail ? (uint8_t)MENU_TREE_MAX_LINES : (uint8_t)(MENU_TREE_MAX_LINES - 2);
        if (count >= limit) { return 0; }
        char *l = lines[count++]; l[0] = '\0'; return l;
    }
};

static inline void format_item(char *out, char const *label, int hot, bool selected, bool styled) {
    size_t const cap = MENU_TREE_MAX_LINE;
    /* A long label is cut short of the closing codes so no style leaks past the line. */
    size_t const body = cap - ((selected && styled) ? strlen(STYLE_OFF[STYLE_ITALIC]) : 0);
    append_capped(out, cap, selected ? ">" : " ");
    if (selected && styled) { append_capped(out, cap, STYLE_ON[STYLE_ITALIC]); }
    if (hot < 0) {
        append_capped(out, body, label);
    } else {
        char key[2] = { label[hot], '\0' };
        size_t const key_len = styled ? strlen(STYLE_ON[STYLE_UNDERLINE]) + 1 + strlen(STYLE_OFF[STYLE_UNDERLINE]) : 1;
        append_n(out, body, label, (size_t)hot);
        if (strlen(out) + key_len < body) {
            append_styled(out, body, key, STYLE_UNDERLINE, styled);
            append_capped(out, body, label + hot + 1);
        }
    }
    if (selected && styled) { append_capped(out, cap, STYLE_OFF[STYLE_ITALIC]); }
}

/* Lays out m as the current menu of g. Rebuilds m's hotkeys, clamps its selection and
   records the layout metrics the next render needs to erase this one. */
static inline void render_frame(menu_graph_t const &g, menu_node_t &m, bool styled, menu_frame_t &f) {
    size_t const cap = MENU_TREE_MAX_LINE;
    f.count = 0;
    m.clear_hot_keys();

    uint8_t const subs  = g.submenu_count(m);
    uint8_t const total = (uint8_t)(m.option_count + subs);
    if (total == 0) { m.selection = 0; } else if (m.selection >= total) { m.selection = (uint8_t)(total - 1); }

    char *l = f.next_line();
    append_capped(l, cap, "Menu: ");
    append_styled(l, cap, m.name, STYLE_BOLD, styled);

    /* Item lines always fit; the prompt gets whatever is left and ends in "..." when cut. */
    int const item_lines = (m.option_count ? m.option_count + 1 : 0) + (subs ? subs + 1 : 0);
    int const room = MENU_TREE_MAX_LINES - 3 - item_lines;

    char const *p = m.resolve_prompt();
    if (p && *p && room > 0) {
        char text[MENU_TREE_MAX_PROMPT]; text[0] = '\0';
        append_capped(text, sizeof(text), p);
        bool const clipped = strlen(p) >= sizeof(text);
        collapse_pair(text, '\r', '\n');
        collapse_pair(text, '\n', '\r');
        int used = 0;
        for (char *start = text; ; ) {
            char *nl = strchr(start, '\n');
            if (nl) { *nl = '\0'; }
            l = f.next_line();
            ++used;
            append_capped(l, cap, " ");
            if (nl && used == room) { append_capped(l, cap, "..."); break; }
            append_capped(l, cap, start);
            if (!nl) {
                if (clipped) { append_capped(l, cap, "..."); }
                break;
            }
            start = nl + 1;
        }
    }

    for (uint8_t i = 0; i < m.option_count; ++i) {
        if (i == 0 && (l = f.next_line()) != 0) { append_styled(l, cap, "Options:", STYLE_BOLD, styled); }
        char const *label = m.options[i].name;
        int const hot = m.assign_hot_key(label, i);
        if ((l = f.next_line()) != 0) { format_item(l, label, hot, i == m.selection, styled); }
    }

    if (subs) {
        if ((l = f.next_line()) != 0) { append_styled(l, cap, "SubMenus:", STYLE_BOLD, styled); }
        for (uint8_t i = 0; i < subs; ++i) {
            uint8_t const idx = (uint8_t)(m.option_count + i);
            char const *label = g.submenu_at(m, i)->name;
            int const hot = m.assign_hot_key(label, idx);
            if ((l = f.next_line()) != 0) { format_item(l, label, hot, idx == m.selection, styled); }
        }
    }

    f.next_line(true);
    l = f.next_line(true);
    if (g.previous) {
        append_capped(l, cap, " \xE2\x86\x90/esc back to ");
        append_capped(l, cap, g.previous->name);
        append_capped(l, cap, ", E");
        append_styled(l, cap, "x", STYLE_UNDERLINE, styled);
        append_capped(l, cap, "it ");
    } else {
        append_capped(l, cap, "E");
        append_styled(l, cap, "x", STYLE_UNDERLINE, styled);
        append_capped(l, cap, "it");
    }

    uint16_t widest = 0;
    for (uint8_t i = 0; i < f.count; ++i) { uint16_t const w = visible_width(f.lines[i]); if (w > widest) { widest = w; } }
    f.longest = (uint16_t)(widest + 2);
    m.longest_line = f.longest;
    m.last_render_lines = (uint8_t)(f.count + 1);
}

/* ============================== Key Decoding ============================= */

static inline key_event_t make_event(command_t cmd, char literal = 0) { key_event_t e; e.cmd = cmd; e.literal = literal; return e; }

/* n is the byte count of one read. Three bytes are an arrow sequence, judged by the last byte. */
static inline key_event_t decode_keys(uint8_t const *buf, int n) {
    if (n < 0)  { return make_event(Cmd_Fail); }
    if (n == 0) { return make_event(Cmd_Empty); }
    if (n >= 3) {
        switch (buf[2]) {
            case MK_UP:    return make_event(Cmd_Up);
            case MK_DOWN:  return make_event(Cmd_Down);
            case MK_LEFT:  return make_event(Cmd_Back);
            case MK_RIGHT: return make_event(Cmd_Enter);
            default:       return make_event(Cmd_Down);
        }
    }
    switch (buf[0]) {
        case MK_ENTER:    return make_event(Cmd_Enter);
        case MK_ESCAPE:   return make_event(Cmd_Back);
        case MK_BACKTICK: return make_event(Cmd_Toggle);
        case MK_EXIT:
        case MK_CTRL_C:   return make_event(Cmd_Exit);
        default:          return make_event(Cmd_Literal, (char)buf[0]);
    }
}

/* Holds the terminal in raw mode for one read and restores it on every way out. */
struct raw_scope_t {
    term_source_t const &src;
    bool ok;

    explicit raw_scope_t(term_source_t const &s) : src(s), ok(true) {
        if (src.ops->raw_enter) { ok = src.ops->raw_enter(src.ctx); }
    }
    ~raw_scope_t() {
        if (ok && src.ops->raw_restore) { src.ops->raw_restore(src.ctx); }
    }

private:
    raw_scope_t(raw_scope_t const &);
    raw_scope_t &operator=(raw_scope_t const &);
};

static inline key_event_t read_command(term_source_t const &src) {
    if (!src.ops || !src.ops->read) { return make_event(Cmd_Fail); }
    raw_scope_t raw(src);
    if (!raw.ok) { return make_event(Cmd_Fail); }
    uint8_t buf[3] = { 0, 0, 0 };
    return decode_keys(buf, src.ops->read(src.ctx, buf, (uint8_t)sizeof(buf)));
}

/* ============================== Action Runner ============================ */

typedef void (*action_run_fptr_t)(void *ctx, menu_option_t const &option);

struct action_runner_t {
    void              *ctx;
    action_run_fptr_t  run;
};

static inline void call_action(void *, menu_option_t const &option) { if (option.fn) { option.fn(); } }

static inline action_runner_t make_call_runner(void) { action_runner_t r; r.ctx = 0; r.run = &call_action; return r; }

/* ============================ Session Runtime ============================ */

struct menu_session_t {
    menu_graph_t     &graph;
    term_source_t     term;
    output_t          out;
    action_runner_t   runner;
    uint8_t           displaying : 1,
                      redraw     : 1,
                      styled     : 1,
                      failed     : 1,
                      _pad       : 4;
    menu_frame_t      frame;

    menu_session_t(menu_graph_t &g, term_source_t const &t, output_t const &o)
        : graph(g), term(t), out(o), runner(make_call_runner()),
          displaying(0), redraw(1), styled(1), failed(0), _pad(0) {
        frame.count = 0;
        frame.longest = 0;
    }

    inline char const *name() const   { return graph.name(); }
    inline char const *prompt() const { return graph.prompt(); }

    /* ---------- output ---------- */
    inline void write(char const *text) { if (out.write && text) { out.write(out.ctx, text); } }
    inline void flush(void) { if (out.flush) { out.flush(out.ctx); } }

    inline void write_styled(char const *text, style_t st) {
        char buf[MENU_TREE_MAX_LINE]; buf[0] = '\0';
        append_styled(buf, sizeof(buf), text, st, styled);
        write(buf);
    }

    inline void cursor_up(int lines) {
        char nb[12];
        write("\033["); write(int_to_str(lines, nb, sizeof(nb))); write("A");
    }

    /* text, then fill up to the current menu's width, then a newline */
    inline void write_banner(char const *text, char fill) {
        char line[MENU_TREE_MAX_LINE]; line[0] = '\0';
        append_capped(line, sizeof(line), text);
        append_fill(line, sizeof(line), fill, (int)graph.current->longest_line - (int)visible_width(line));
        write(line); write("\033[K\n");
    }

    /* Blocks for one key. A terminal failure ends the session. */
    inline bool wait_key(void) {
        flush();
        if (read_command(term).cmd == Cmd_Fail) { failed = 1; displaying = 0; return false; }
        return true;
    }

    /* ---------- rendering ---------- */
    void render(void) {
        menu_node_t &m = *graph.current;
        if (m.last_render_lines > 0 && redraw) { cursor_up(m.last_render_lines); }
        render_frame(graph, m, styled, frame);

        char rule[MENU_TREE_MAX_LINE + 8]; rule[0] = '\0';
        append_fill(rule, sizeof(rule), '*', frame.longest + 4);
        write("\n"); write(rule); write("\033[K\n");
        for (uint8_t i = 0; i + 1 < frame.count; ++i) { write("  "); write(frame.lines[i]); write("\033[K\n"); }

        char const *footer = frame.lines[frame.count - 1];
        char last[MENU_TREE_MAX_LINE + 8]; last[0] = '\0';
        append_capped(last, sizeof(last), "**");
        append_capped(last, sizeof(last), footer);
        append_fill(last, sizeof(last), '*', (int)frame.longest - (int)visible_width(footer));
        append_capped(last, sizeof(last), "**");
        write(last); write("\033[J");
        flush();
    }

    /* ---------- navigation ---------- */
    void change_menu(menu_node_t &target) {
        graph.change_menu(target);
        if (displaying) { render(); }
    }

    void set_prompt(char const *p, menu_prompt_fptr_t fn = 0) {
        graph.current->set_prompt(p, fn);
        if (displaying) { render(); }
    }

    void execute(uint8_t index) {
        menu_node_t &m = *graph.current;

        if (index < m.option_count) {
            if (redraw) { cursor_up(2); }
            m.last_render_lines = 0;
            menu_option_t const option = m.options[index];

            char line[MENU_TREE_MAX_LINE]; line[0] = '\0';
            append_capped(line, sizeof(line), "*** Executing ");
            append_capped(line, sizeof(line), option.name);
            append_capped(line, sizeof(line), "... ***");
            write("\n");
            write_banner(line, '*');

            if (!option.fn) {
                write("\nError, no action bound to ");
                write(option.name);
                write(".\n(Press any key to continue)\n");
                if (wait_key()) { render(); }
                return;
            }

            write_banner("------------- Output -------------", '-');
            flush();
            if (runner.run) { runner.run(runner.ctx, option); }
            write_banner("-------------- End ---------------", '-');
            write("(Press any key to continue)\n");
            if (!wait_key()) { return; }
            write("\n");
            render();
            return;
        }

        uint8_t const subs = graph.submenu_count(m);
        uint8_t const sub  = (uint8_t)(index - m.option_count);
        if (sub < subs) {
            menu_node_t *child = graph.submenu_at(m, sub);
            if (child) { change_menu(*child); return; }
        }

        write(subs ? "\nError, no submenu at that position.\n" : "\nError, menu has no submenus.\n");
        write("(Press any key to continue)\n");
        m.last_render_lines = (uint8_t)(m.last_render_lines + 3);
        if (wait_key()) { render(); }
    }

    void handle(key_event_t const &ev) {
        menu_node_t &m = *graph.current;
        uint8_t const total = graph.item_count(m);
        if (total && m.selection >= total) { m.selection = (uint8_t)(total - 1); }

        switch (ev.cmd) {
            case Cmd_Up:
                if (total) { m.selection = (m.selection == 0) ? (uint8_t)(total - 1) : (uint8_t)(m.selection - 1); render(); }
                break;
            case Cmd_Down:
                if (total) { m.selection = (uint8_t)((m.selection + 1) % total); render(); }
                break;
            case Cmd_Enter:
                execute(m.selection);
                break;
            case Cmd_Back:
                if (graph.previous) { change_menu(*graph.previous); }
                break;
            case Cmd_Toggle:
                if (redraw) {
                    redraw = 0;
                    write("\nredraw disabled\n");
                    render();
                } else {
                    write("\nredraw enabled\n");
                    render();
                    redraw = 1;
                }
                break;
            case Cmd_Exit:
                displaying = 0;
                break;
            case Cmd_Literal: {
                int const idx = m.hot_key_index(ev.literal);
                if (idx >= 0) { m.selection = (uint8_t)idx; execute((uint8_t)idx); }
            } break;
            case Cmd_Fail:
                failed = 1;
                displaying = 0;
                break;
            case Cmd_Empty:
            default: break;
        }
    }

    inline void step(void) { handle(read_command(term)); }

    /* Blocks until the user exits. False if the terminal failed. */
    bool display(void) {
        displaying = 1;
        failed = 0;
        graph.current->selection = 0;

        write("Welcome to menu tree.\n");
        write("\xE2\x86\x95 to move selection cursor.\n");
        write("\xE2\x86\x92/Enter/H"); write_styled("o", STYLE_UNDERLINE); write("tkey to choose.\n");
        write("\xE2\x86\x90/Esc to go back, "); write_styled("x", STYLE_UNDERLINE); write(" to Exit.\n");
        write("` (backtick) to toggle redraw (small terminals may scramble)\n");
        write("Press any key to start menu...\n");

        if (wait_key()) {
            uint8_t const keep = redraw;
            redraw = 0;
            render();
            redraw = keep;
            write("\033[?25l");
            while (displaying) { step(); }
        }

        write("\n\033[?25h");
        flush();
        displaying = 0;
        return !failed;
    }
};

/* ======================== Built-in Terminal: POSIX ======================= */
#if defined(__unix__) || defined(__APPLE__)
struct tty_ctx_t {
    char const     *path;
    int             fd;
    int             last_errno;   /* errno of the last failure, 0 if none */
    struct termios  saved;
};

static bool tty_raw_enter(void *ctx) {
    tty_ctx_t &t = *static_cast<tty_ctx_t *>(ctx);
    t.fd = ::open(t.path, O_RDWR | O_NOCTTY);
    if (t.fd < 0) { t.last_errno = errno; return false; }
    if (::tcgetattr(t.fd, &t.saved) != 0) { t.last_errno = errno; ::close(t.fd); t.fd = -1; return false; }

    struct termios raw = t.saved;
    raw.c_iflag &= ~(tcflag_t)(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON);
    raw.c_oflag &= ~(tcflag_t)OPOST;
    raw.c_lflag &= ~(tcflag_t)(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
    raw.c_cflag &= ~(tcflag_t)(CSIZE | PARENB);
    raw.c_cflag |= CS8;
    raw.c_cc[VMIN]  = 1;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(t.fd, TCSANOW, &raw) != 0) { t.last_errno = errno; ::close(t.fd); t.fd = -1; return false; }
    return true;
}

static void tty_raw_restore(void *ctx) {
    tty_ctx_t &t = *static_cast<tty_ctx_t *>(ctx);
    if (t.fd < 0) { return; }
    if (::tcsetattr(t.fd, TCSANOW, &t.saved) != 0) { t.last_errno = errno; }
    if (::close(t.fd) != 0) { t.last_errno = errno; }
    t.fd = -1;
}

static int tty_read(void *ctx, uint8_t *buf, uint8_t cap) {
    tty_ctx_t &t = *static_cast<tty_ctx_t *>(ctx);
    for (;;) {
        ssize_t const n = ::read(t.fd, buf, cap);
        if (n > 0) { return (int)n; }
        if (n < 0 && errno == EINTR) { continue; }
        t.last_errno = (n < 0) ? errno : EIO;   /* end of file: the terminal went away */
        return -1;
    }
}

static term_ops_t const TTY_OPS = { &tty_raw_enter, &tty_raw_restore, &tty_read };

/* Returns a source backed by the given terminal device. Single instance ok. */
static inline term_source_t make_tty_input(char const *path = "/dev/tty") {
    static tty_ctx_t ctx;
    ctx.path = path; ctx.fd = -1; ctx.last_errno = 0;
    term_source_t s; s.ctx = &ctx; s.ops = &TTY_OPS; return s;
}

static inline int tty_last_errno(term_source_t const &s) { return static_cast<tty_ctx_t const *>(s.ctx)->last_errno; }

static void stdout_write(void *, char const *text) { fputs(text, stdout); }
static void stdout_flush(void *) { fflush(stdout); }

static inline output_t make_stdout_output(void) {
    output_t o; o.ctx = 0; o.write = &stdout_write; o.flush = &stdout_flush; return o;
}
#endif

#endif /* MENU_TREE_H */
