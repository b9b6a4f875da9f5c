// file      : sqlgen/sql-lexer.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cctype> // std::is{alpha,alnum,space,digit}

#include <sqlgen/sql-lexer.hxx>

using namespace std;

static inline bool
is_alpha (char c)
{
  return isalpha (static_cast<unsigned char> (c)) ||
    c == '_' || c == '@' || c == '#' ||
    (static_cast<unsigned char> (c) & 0x80) != 0; // UTF-8 sequence.
}

static inline bool
is_alnum (char c)
{
  return is_alpha (c) || c == '$' ||
    isdigit (static_cast<unsigned char> (c));
}

static inline bool
is_digit (char c)
{
  return isdigit (static_cast<unsigned char> (c)) != 0;
}

static inline bool
is_space (char c)
{
  return isspace (static_cast<unsigned char> (c)) != 0;
}

sql_lexer::
sql_lexer ()
    : s_ (&buf_), pos_ (0), l_ (1), c_ (1), peeked_ (false)
{
}

sql_lexer::
sql_lexer (string const& sql)
    : s_ (&buf_), pos_ (0), l_ (1), c_ (1), peeked_ (false)
{
  lex (sql);
}

void sql_lexer::
lex (string const& sql)
{
  buf_ = sql;
  s_ = &buf_;
  pos_ = 0;
  l_ = 1;
  c_ = 1;
  peeked_ = false;
}

sql_lexer::xchar sql_lexer::
peek_char ()
{
  if (pos_ < s_->size ())
    return xchar (xchar::traits_type::to_int_type ((*s_)[pos_]),
                  l_, c_, pos_);
  else
    return xchar (xchar::traits_type::eof (), l_, c_, pos_);
}

sql_lexer::xchar sql_lexer::
get ()
{
  xchar c (peek_char ());

  if (!is_eos (c))
  {
    pos_++;

    if (c == '\n')
    {
      l_++;
      c_ = 1;
    }
    else
      c_++;
  }

  return c;
}

sql_token sql_lexer::
peek ()
{
  if (!peeked_)
  {
    size_t p (pos_), l (l_), c (c_);
    peek_ = next ();
    peek_pos_ = pos_;
    peek_l_ = l_;
    peek_c_ = c_;
    pos_ = p;
    l_ = l;
    c_ = c;
    peeked_ = true;
  }

  return peek_;
}

sql_token sql_lexer::
next ()
{
  if (peeked_)
  {
    peeked_ = false;
    pos_ = peek_pos_;
    l_ = peek_l_;
    c_ = peek_c_;
    return peek_;
  }

  skip_spaces ();

  xchar c (get ());

  if (is_eos (c))
    return token (c, sql_token ());

  switch (c)
  {
  case ';':
    return token (c, sql_token (sql_token::p_semi));
  case ',':
    return token (c, sql_token (sql_token::p_comma));
  case '(':
    return token (c, sql_token (sql_token::p_lparen));
  case ')':
    return token (c, sql_token (sql_token::p_rparen));
  case '=':
    return token (c, sql_token (sql_token::p_eq));
  case '[':
  case '"':
    return quoted_identifier (c);
  case '\'':
    return string_literal (c, false);
  case '.':
    {
      xchar p (peek_char ());

      if (!is_eos (p) && is_digit (p))
        return number_literal (c);

      return token (c, sql_token (sql_token::p_dot));
    }
  case '+':
  case '-':
  case '*':
  case '/':
  case '%':
  case '<':
  case '>':
  case '!':
  case '&':
  case '|':
  case '^':
  case '~':
  case ':':
    return token (c, sql_token (sql_token::p_other, c));
  default:
    break;
  }

  if (c == 'N' || c == 'n')
  {
    if (peek_char () == '\'')
      return string_literal (c, true);
  }

  if (is_alpha (c))
    return identifier (c);

  if (is_digit (c))
    return number_literal (c);

  throw invalid_input (
    "unexpected character '" + string (1, c) + "'", c.line (), c.column ());
}

void sql_lexer::
skip_spaces ()
{
  for (xchar c (peek_char ());; c = peek_char ())
  {
    if (is_eos (c))
      break;

    if (c == '-' && pos_ + 1 < s_->size () && (*s_)[pos_ + 1] == '-')
    {
      // Single-line comment.
      //
      for (c = get (); !is_eos (c) && c != '\n'; c = get ()) ;
      continue;
    }

    if (c == '/' && pos_ + 1 < s_->size () && (*s_)[pos_ + 1] == '*')
    {
      // Block comment. These nest in T-SQL.
      //
      xchar start (get ());
      get ();

      size_t depth (1);

      while (depth != 0)
      {
        c = get ();

        if (is_eos (c))
          throw invalid_input ("unterminated comment",
                               start.line (), start.column ());

        if (c == '/' && peek_char () == '*')
        {
          get ();
          depth++;
        }
        else if (c == '*' && peek_char () == '/')
        {
          get ();
          depth--;
        }
      }

      continue;
    }

    if (!is_space (c))
      break;

    get ();
  }
}

sql_token sql_lexer::
identifier (xchar c)
{
  string id;
  id += c;

  for (xchar n (peek_char ()); !is_eos (n) && is_alnum (n); n = peek_char ())
    id += get ();

  return token (c, sql_token (sql_token::t_identifier, id));
}

sql_token sql_lexer::
quoted_identifier (xchar c)
{
  char close (c == '[' ? ']' : '"');
  string id;

  for (;;)
  {
    xchar n (get ());

    if (is_eos (n))
      throw invalid_input ("unterminated quoted identifier",
                           c.line (), c.column ());

    if (n == close)
    {
      // Doubled closing character is an escape.
      //
      if (peek_char () == close)
      {
        id += get ();
        continue;
      }

      break;
    }

    id += n;
  }

  return token (c, sql_token (sql_token::t_identifier, id, true));
}

sql_token sql_lexer::
number_literal (xchar c)
{
  string lit;
  bool flt (false);

  lit += c;

  if (c == '.')
    flt = true;
  else if (c == '0' && (peek_char () == 'x' || peek_char () == 'X'))
  {
    // Binary constant, 0x1F.
    //
    lit += get ();

    for (xchar n (peek_char ());
         !is_eos (n) && isxdigit (static_cast<unsigned char> (n));
         n = peek_char ())
      lit += get ();

    return token (c, sql_token (sql_token::t_int_lit, lit));
  }

  for (xchar n (peek_char ()); !is_eos (n); n = peek_char ())
  {
    if (is_digit (n))
      lit += get ();
    else if (n == '.' && !flt)
    {
      flt = true;
      lit += get ();
    }
    else if (n == 'e' || n == 'E')
    {
      flt = true;
      lit += get ();

      n = peek_char ();
      if (n == '+' || n == '-')
        lit += get ();

      n = peek_char ();
      if (is_eos (n) || !is_digit (n))
        throw invalid_input ("invalid exponent in numeric literal",
                             c.line (), c.column ());
    }
    else
      break;
  }

  return token (
    c, sql_token (flt ? sql_token::t_float_lit : sql_token::t_int_lit, lit));
}

sql_token sql_lexer::
string_literal (xchar c, bool national)
{
  if (national)
    get (); // Opening quote.

  string lit;

  for (;;)
  {
    xchar n (get ());

    if (is_eos (n))
      throw invalid_input ("unterminated string literal",
                           c.line (), c.column ());

    if (n == '\'')
    {
      if (peek_char () == '\'')
      {
        lit += get ();
        continue;
      }

      break;
    }

    lit += n;
  }

  return token (c, sql_token (sql_token::t_string_lit, lit, national));
}

sql_token sql_lexer::
token (xchar const& start, sql_token t)
{
  t.position (start.line (), start.column (), start.offset ());
  return t;
}
