/**
 * MenuTreeDemo.cpp
 *
 * example program for the MenuTree library
 *
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "MenuTree.h"

/* Demo values & actions */
static int counter = 0;
static char status_buf[96];

static void fn_hello() {
    printf("\n[action] hello\n");
}

static void fn_count() {
    counter++;
    printf("\n[action] counter is now %d\n", counter);
}

static void fn_reset() {
    counter = 0;
    printf("\n[action] reset\n");
}

static void fn_about() {
    printf("\n[action] MenuTree demo, arrows or hotkeys to navigate\n");
}

static char const *status_prompt() {
    snprintf(status_buf, sizeof(status_buf), "counter: %d\r\npick an action or a submenu", counter);
    return status_buf;
}

/* Menus */
static menu_node_t main_menu("Main", 0, status_prompt);
static menu_node_t actions_menu("Actions", "Things that change the counter");
static menu_node_t tools_menu("Tools", "Reached through Actions\nback returns to the previous menu only");

int main() {
    main_menu.add_option("Say Hello", fn_hello);
    main_menu.add_option("About", fn_about);

    actions_menu.add_option("Count", fn_count);
    actions_menu.add_option("Reset Counter", fn_reset);

    tools_menu.add_option("Say Hello", fn_hello);

    static menu_graph_t graph(main_menu);
    menu_node_t *children[] = { &actions_menu, &tools_menu };
    if (!graph.add_submenus(main_menu, children) || !graph.add_submenu(actions_menu, tools_menu)) {
        fprintf(stderr, "menu: too many submenus for this build\n");
        return EXIT_FAILURE;
    }

    term_source_t in = make_tty_input();
    static menu_session_t session(graph, in, make_stdout_output());
    if (!session.display()) {
        fprintf(stderr, "menu: terminal error: %s\n", strerror(tty_last_errno(in)));
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
