#include "options.hh"
#include <getopt.h>
#include <stdlib.h>
#include <sstream>
#include <string.h>

using namespace brf;


/* ********************************************************************************************* *
 * Implementation of Options
 * ********************************************************************************************* */
const Options::Value Options::_none;

Options::Options()
  : _options()
{
  // pass...
}

bool
Options::has(const char *name) const {
  return _options.end() != _options.find(name);
}

const Options::Value &
Options::get(const char *name) const {
  std::map<std::string, Value>::const_iterator item = _options.find(name);
  if (_options.end() == item) { return _none; }
  return item->second;
}

long
Options::get(const char *name, long def) const {
  const Value &value = get(name);
  if (value.isInteger()) { return value.toInteger(); }
  return def;
}

std::string
Options::get(const char *name, const std::string &def) const {
  const Value &value = get(name);
  if (value.isString()) { return value.toString(); }
  return def;
}

void
Options::store(const Definition &def, const char *arg) {
  if (FLAG == def.type) { _options[def.name] = Value(); }
  else if (INTEGER == def.type) { _options[def.name] = Value(atol(arg)); }
  else if (FLOAT == def.type) { _options[def.name] = Value(atof(arg)); }
  else if (ANY == def.type) { _options[def.name] = Value(std::string(arg)); }
}

bool
Options::parse(const Definition defs[], int argc, char *argv[], Options &options)
{
  // Get number of definitions
  int nopts = 0;
  for (const Definition *def = defs; def->name; def++) { nopts++; }

  struct option *getopt_options = (struct option *)malloc((nopts+1)*sizeof(struct option));
  std::string short_opt_str;
  for (int i=0; i<nopts; i++) {
    getopt_options[i].name = defs[i].name;
    getopt_options[i].has_arg = (FLAG == defs[i].type) ? no_argument : required_argument;
    getopt_options[i].flag = 0;
    // long options without a short name are identified by their index
    getopt_options[i].val = defs[i].short_name ? defs[i].short_name : 0;
    if (defs[i].short_name) {
      short_opt_str += defs[i].short_name;
      if (FLAG != defs[i].type) { short_opt_str += ':'; }
    }
  }
  // add sentinel
  memset(getopt_options+nopts, 0, sizeof(struct option));

  bool ok = true;
  // Restart scanning, parse may be called more than once
  optind = 0;
  // Parse options using getopt
  while (ok) {
    int option_index = -1;
    int c = getopt_long(argc, argv, short_opt_str.c_str(), getopt_options, &option_index);
    if (-1 == c) { break; }
    if ('?' == c) { ok = false; break; }

    const Definition *def = 0;
    if ((0 == c) && (0 <= option_index)) {
      def = defs + option_index;
    } else {
      for (int i=0; i<nopts; i++) {
        if (c == defs[i].short_name) { def = defs+i; break; }
      }
    }
    if (0 == def) { ok = false; break; }
    options.store(*def, optarg);
  }

  free(getopt_options);
  return ok;
}


void
Options::print_help(std::ostream &stream, const Definition defs[])
{
  for (const Definition *def = defs; def->name; def++) {
    stream << "--" << def->name;
    if (def->short_name) { stream << ", -" << def->short_name; }
    if (INTEGER == def->type) { stream << " INTEGER"; }
    else if (FLOAT == def->type) { stream << " FLOAT"; }
    else if (ANY == def->type) { stream << " VALUE"; }
    stream << std::endl;
    if (def->help) {
      std::istringstream iss(def->help);
      std::string line("  "), word;
      while (iss >> word) {
        if ((line.length()+word.length()) > 78) {
          stream << line << std::endl;
          line = "  ";
        }
        line += word + " ";
      }
      if (line.length() > 2) { stream << line << std::endl; }
    }
    stream << std::endl;
  }
}



/* ********************************************************************************************* *
 * Implementation of Value
 * ********************************************************************************************* */
Options::Value::Value()
  : _type(NONE)
{
  // pass...
}

Options::Value::Value(long value)
  : _type(INTEGER)
{
  _value.as_int = value;
}

Options::Value::Value(double value)
  : _type(FLOAT)
{
  _value.as_float = value;
}

Options::Value::Value(const std::string &value)
  : _type(STRING)
{
  _value.as_string = strdup(value.c_str());
}

Options::Value::~Value() {
  if (STRING == _type) { free(_value.as_string); }
}

Options::Value::Value(const Value &other)
  : _type(other._type), _value(other._value)
{
  if (STRING == _type) { _value.as_string = strdup(_value.as_string); }
}

const Options::Value &
Options::Value::operator =(const Value &other) {
  if (this == &other) { return *this; }
  if (STRING == _type) { free(_value.as_string); }
  _type = other._type;
  if (NONE == _type) { /* pass...*/ }
  else if (INTEGER == _type) { _value.as_int = other._value.as_int; }
  else if (FLOAT == _type) { _value.as_float = other._value.as_float; }
  else if (STRING == _type) { _value.as_string = strdup(other._value.as_string); }
  return *this;
}

bool
Options::Value::isNone() const {
  return NONE == _type;
}

bool
Options::Value::isInteger() const {
  return INTEGER == _type;
}

bool
Options::Value::isFloat() const {
  return FLOAT == _type;
}

bool
Options::Value::isString() const {
  return STRING == _type;
}

long
Options::Value::toInteger() const {
  if (FLOAT == _type) { return long(_value.as_float); }
  if (INTEGER != _type) { return 0; }
  return _value.as_int;
}

double
Options::Value::toFloat() const {
  if (INTEGER == _type) { return double(_value.as_int); }
  if (FLOAT != _type) { return 0; }
  return _value.as_float;
}

std::string
Options::Value::toString() const {
  if (STRING != _type) { return ""; }
  return _value.as_string;
}
