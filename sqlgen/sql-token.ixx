// file      : sqlgen/sql-token.ixx
// license   : GNU GPL v3; see accompanying LICENSE file

inline sql_token::token_type sql_token::
type () const
{
  return type_;
}

inline std::string const& sql_token::
identifier () const
{
  return str_;
}

inline bool sql_token::
quoted () const
{
  return type_ == t_identifier && flag_;
}

inline sql_token::punctuation_type sql_token::
punctuation () const
{
  return type_ == t_punctuation ? punctuation_ : p_invalid;
}

inline std::string const& sql_token::
literal () const
{
  return str_;
}

inline bool sql_token::
national () const
{
  return type_ == t_string_lit && flag_;
}

inline std::size_t sql_token::
line () const
{
  return line_;
}

inline std::size_t sql_token::
column () const
{
  return column_;
}

inline std::size_t sql_token::
offset () const
{
  return offset_;
}

inline void sql_token::
position (std::size_t l, std::size_t c, std::size_t o)
{
  line_ = l;
  column_ = c;
  offset_ = o;
}

inline sql_token::
sql_token ()
    : type_ (t_eos), punctuation_ (p_invalid), flag_ (false),
      line_ (0), column_ (0), offset_ (0)
{
}

inline sql_token::
sql_token (punctuation_type p, char c)
    : type_ (t_punctuation), punctuation_ (p), flag_ (false),
      line_ (0), column_ (0), offset_ (0)
{
  if (c != '\0')
    str_ = std::string (1, c);
}

inline sql_token::
sql_token (token_type t, std::string const& s, bool flag)
    : type_ (t), punctuation_ (p_invalid), str_ (s), flag_ (flag),
      line_ (0), column_ (0), offset_ (0)
{
}
