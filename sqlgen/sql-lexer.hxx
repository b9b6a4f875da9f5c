// file      : sqlgen/sql-lexer.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SQL_LEXER_HXX
#define SQLGEN_SQL_LEXER_HXX

#include <string>
#include <cstddef> // std::size_t

#include <sqlgen/sql-token.hxx>

// A T-SQL lexer. Handles bare, [bracketed] and "double-quoted"
// identifiers, N'national' string literals, as well as the -- and
// (nested) /* */ comments.
//
class sql_lexer
{
public:
  sql_lexer ();
  sql_lexer (std::string const& sql);

  void
  lex (std::string const& sql);

  struct invalid_input
  {
    invalid_input (std::string const& m, std::size_t l, std::size_t c)
        : message (m), line (l), column (c)
    {
    }

    std::string message;
    std::size_t line;
    std::size_t column;
  };

  sql_token
  next ();

  // Return the next token without consuming it.
  //
  sql_token
  peek ();

  // Current position. After next() it is just past the returned
  // token. Used to capture source text verbatim.
  //
  std::size_t
  offset () const {return pos_;}

  std::string const&
  text () const {return *s_;}

protected:
  class xchar
  {
  public:
    typedef std::char_traits<char> traits_type;
    typedef traits_type::int_type int_type;
    typedef traits_type::char_type char_type;

    xchar (int_type v, std::size_t l, std::size_t c, std::size_t o);

    operator char_type () const;

    int_type
    value () const;

    std::size_t
    line () const;

    std::size_t
    column () const;

    std::size_t
    offset () const;

  private:
    int_type v_;
    std::size_t l_;
    std::size_t c_;
    std::size_t o_;
  };

  xchar
  peek_char ();

  xchar
  get ();

  bool
  is_eos (xchar const&) const;

protected:
  void
  skip_spaces ();

  sql_token
  identifier (xchar);

  sql_token
  quoted_identifier (xchar);

  sql_token
  number_literal (xchar);

  sql_token
  string_literal (xchar, bool national);

  sql_token
  token (xchar const& start, sql_token t);

private:
  std::string const* s_;
  std::string buf_;

  std::size_t pos_;
  std::size_t l_;
  std::size_t c_;

  bool peeked_;
  sql_token peek_;
  std::size_t peek_pos_, peek_l_, peek_c_;
};

#include <sqlgen/sql-lexer.ixx>

#endif // SQLGEN_SQL_LEXER_HXX
