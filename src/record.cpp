#include "record.hpp"

#include "duckdb.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

Record::Record(std::initializer_list<field> fields_) {
  for (const auto &f : fields_) {
    set(f.first, f.second);
  }
}

void Record::set(const std::string &name, duckdb::Value value) {
  for (auto &f : fields) {
    if (f.first == name) {
      f.second = std::move(value);
      return;
    }
  }
  fields.emplace_back(name, std::move(value));
}

const duckdb::Value *Record::find(const std::string &name) const {
  for (const auto &f : fields) {
    if (f.first == name) {
      return &f.second;
    }
  }
  return nullptr;
}

const duckdb::Value &Record::get(const std::string &name) const {
  const auto *value = find(name);
  if (value == nullptr) {
    throw std::out_of_range("Record has no field <" + name + ">");
  }
  return *value;
}

bool Record::contains(const std::string &name) const {
  return find(name) != nullptr;
}

std::vector<std::string> Record::keys() const {
  std::vector<std::string> result;
  result.reserve(fields.size());
  for (const auto &f : fields) {
    result.push_back(f.first);
  }
  return result;
}

bool Record::operator==(const Record &other) const {
  if (fields.size() != other.fields.size()) {
    return false;
  }
  for (std::size_t i = 0; i < fields.size(); i++) {
    if (fields[i].first != other.fields[i].first ||
        !duckdb::Value::NotDistinctFrom(fields[i].second,
                                        other.fields[i].second)) {
      return false;
    }
  }
  return true;
}

std::string Record::ToString() const {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &f : fields) {
    if (first) {
      first = false;
    } else {
      out << ", ";
    }
    out << f.first << ": " << f.second.ToString();
  }
  out << "}";
  return out.str();
}
