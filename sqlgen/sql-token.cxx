// file      : sqlgen/sql-token.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <iostream>

#include <sqlgen/sql-token.hxx>

using namespace std;

static char punctuation_literals[] = {';', ',', '(', ')', '=', '.'};

string sql_token::
string () const
{
  switch (type_)
  {
  case t_eos:
    return "<end-of-stream>";
  case t_identifier:
    return flag_ ? '[' + str_ + ']' : str_;
  case t_punctuation:
    {
      if (punctuation_ == p_other)
        return str_;

      return std::string (1, punctuation_literals[punctuation_]);
    }
  case t_string_lit:
    {
      std::string r (flag_ ? "N'" : "'");

      for (std::string::size_type i (0); i != str_.size (); ++i)
      {
        if (str_[i] == '\'')
          r += '\'';

        r += str_[i];
      }

      return r += '\'';
    }
  case t_int_lit:
  case t_float_lit:
    break;
  }

  return str_;
}

ostream&
operator<< (ostream& os, sql_token const& t)
{
  return os << t.string ();
}
