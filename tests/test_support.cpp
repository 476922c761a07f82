#include "fake_runner.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

TempDir::TempDir()
{
  std::string tmpl = (std::filesystem::temp_directory_path() / "switchwatch-XXXXXX").string();
  if (!mkdtemp(&tmpl[0])) throw std::runtime_error("mkdtemp failed");
  dir = tmpl;
}

TempDir::~TempDir()
{
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void TempDir::write(const std::string& name, const std::string& content) const
{
  std::ofstream out(file(name), std::ios::binary | std::ios::trunc);
  out << content;
}
