#pragma once

#include <string>
#include <cstdint>
#include <cstdio>

namespace rtcdrop {

// File/Directory existence check
bool file_exists(const char* path);
bool directory_exists(const char* path);

// File creation and writing
bool create_file(const char* path, const char* content);
bool create_file_binary(const char* path, const void* data, size_t size);

// File reading
char* read_file_text(const char* path, size_t* size_out = nullptr);

// Directory operations
bool create_directory(const char* path);
bool create_directories(const char* path); // Create parent directories if needed

// File information
int64_t get_file_size(const char* path);
bool is_file(const char* path);
bool is_directory(const char* path);

// File operations
bool delete_file(const char* path);
bool delete_directory(const char* path);

// File metadata operations
std::string get_filename_from_path(const char* path);

// Path utilities
std::string combine_paths(const std::string& base, const std::string& relative);

// Utility functions
void free_file_buffer(void* buffer); // Free memory allocated by read functions

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool directory_exists(const std::string& path) { return directory_exists(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file(path.c_str(), content.c_str());
}
inline std::string read_file_text_cpp(const std::string& path) {
    size_t size;
    char* content = read_file_text(path.c_str(), &size);
    if (!content) return "";
    std::string result(content, size);
    free_file_buffer(content);
    return result;
}
inline bool create_directories(const std::string& path) { return create_directories(path.c_str()); }
inline int64_t get_file_size(const std::string& path) { return get_file_size(path.c_str()); }
inline bool is_file(const std::string& path) { return is_file(path.c_str()); }
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }
inline bool delete_directory(const std::string& path) { return delete_directory(path.c_str()); }
inline std::string get_filename_from_path(const std::string& path) { return get_filename_from_path(path.c_str()); }

} // namespace rtcdrop
