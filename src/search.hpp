#pragma once
/*
 * Search
 *
 * Purpose: incremental find (Ctrl-F). Idle -> Active -> Confirmed/Cancelled.
 * State lives in EditorState::search while Active.
 * Step: scan row by row from the last match (or, right after a query edit,
 * from the row the search started on), wrapping at both ends; the first
 * row containing the query wins.
 * Cancel restores the cursor and viewport captured by search_begin().
 */
#include <string>
#include "input.hpp"
#include "types.hpp"

enum class SearchOutcome { Active, Confirmed, Cancelled };

void search_begin(EditorState& st);
SearchOutcome search_handle_key(EditorState& st, const Key& key);
// one incremental step in the current direction; false when nothing matched
bool search_step(EditorState& st);
std::string search_prompt(const SearchState& s, bool found);

// column of the first/last occurrence of query in row, -1 when absent or query is empty
int find_first_in_row(const std::string& row, const std::string& query, size_t from);
int find_last_in_row(const std::string& row, const std::string& query);
