// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/regex.hpp>

#include <compview/strings/tstring.hpp>

namespace compview {
namespace review {

/**
 * One variant (cell) of a comparable set of files, for example the "_diffuse.jpg" pass of "shot_001_diffuse.jpg".
 *
 * The pattern is a Perl syntax regular expression whose first capture group is the radix of a matching filename.
 * It is stored as text because the viewer lets the user edit it by hand.
 */
struct cell_pattern {
    compview::tstring label;   ///< name shown in the UI, never used for matching
    compview::tstring tail;    ///< the filename text following the radix: separator, variant name, extension
    compview::tstring pattern; ///< regular expression capturing the radix in group 1

    cell_pattern() {}

    cell_pattern( const compview::tstring& label, const compview::tstring& tail, const compview::tstring& pattern )
        : label( label )
        , tail( tail )
        , pattern( pattern ) {}
};

inline bool operator==( const cell_pattern& lhs, const cell_pattern& rhs ) {
    return lhs.label == rhs.label && lhs.tail == rhs.tail && lhs.pattern == rhs.pattern;
}

inline bool operator!=( const cell_pattern& lhs, const cell_pattern& rhs ) { return !( lhs == rhs ); }

// Backslash escapes every character that has a meaning in Perl regular expression syntax.
compview::tstring escape_pattern_literal( const compview::tstring& text );

// Returns "^(.*)" followed by the escaped tail and "$".
compview::tstring make_tail_pattern( const compview::tstring& tail );

/**
 * The evaluated form of a cell_pattern's pattern text. Pattern text that does not parse produces an invalid
 * compiled_cell_pattern, which never matches anything; the parse error is kept for display.
 */
class compiled_cell_pattern {
  public:
    explicit compiled_cell_pattern( const compview::tstring& pattern );

    bool is_valid() const { return m_valid; }

    const compview::tstring& get_pattern() const { return m_pattern; }

    // The parse error message when the pattern is invalid, empty otherwise.
    const std::string& get_error() const { return m_error; }

    /**
     * Searches filename for the pattern.
     *
     * @param filename A bare filename.
     * @return The text captured by the first group, or none if the pattern is invalid, does not match, or matched
     *         without its first group taking part.
     */
    boost::optional<compview::tstring> capture_radix( const compview::tstring& filename ) const;

  private:
    compview::tstring m_pattern;
    boost::basic_regex<compview::tchar> m_regex;
    bool m_valid;
    std::string m_error;
};

/**
 * Compiles the pattern of every cell, in order. Invalid patterns are logged as warnings and kept in the output as
 * invalid entries so that indices stay aligned with cellPatterns.
 */
void compile_cell_patterns( const std::vector<cell_pattern>& cellPatterns,
                            std::vector<compiled_cell_pattern>& outCompiled );

} // namespace review
} // namespace compview
