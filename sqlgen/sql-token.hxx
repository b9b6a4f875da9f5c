// file      : sqlgen/sql-token.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SQL_TOKEN_HXX
#define SQLGEN_SQL_TOKEN_HXX

#include <string>
#include <iosfwd>
#include <cstddef> // std::size_t

class sql_token
{
public:
  enum token_type
  {
    t_eos,
    t_identifier,
    t_punctuation,
    t_string_lit,
    t_int_lit,
    t_float_lit
  };

  token_type
  type () const;

  // Identifier
  //
public:
  std::string const&
  identifier () const;

  // True if the identifier was [bracketed] or "double-quoted" and
  // therefore cannot be a keyword.
  //
  bool
  quoted () const;

  // Punctuation
  //
public:
  enum punctuation_type
  {
    p_semi,
    p_comma,
    p_lparen,
    p_rparen,
    p_eq,
    p_dot,
    p_other, // Any other operator character, see literal().
    p_invalid
  };

  // Return the punctuation id if type is t_punctuation and p_invalid
  // otherwise.
  //
  punctuation_type
  punctuation () const;

  // Literals. For string literals this is the unescaped content. For
  // p_other punctuation this is the operator character.
  //
public:
  std::string const&
  literal () const;

  // True if a string literal had the N prefix.
  //
  bool
  national () const;

  // Source representation suitable for diagnostics.
  //
  std::string
  string () const;

  // Position of the first character of the token. Lines and columns
  // are 1-based.
  //
public:
  std::size_t
  line () const;

  std::size_t
  column () const;

  std::size_t
  offset () const;

  void
  position (std::size_t line, std::size_t column, std::size_t offset);

  // C-tors.
  //
public:
  // EOS and punctuations.
  //
  sql_token ();
  sql_token (punctuation_type p, char c = '\0');

  // Identifier and literals.
  //
  sql_token (token_type t, std::string const& s, bool flag = false);

private:
  token_type type_;
  punctuation_type punctuation_;
  std::string str_;
  bool flag_;

  std::size_t line_;
  std::size_t column_;
  std::size_t offset_;
};

std::ostream&
operator<< (std::ostream&, sql_token const&);

#include <sqlgen/sql-token.ixx>

#endif // SQLGEN_SQL_TOKEN_HXX
