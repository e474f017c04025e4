#include "fs.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#include <sys/stat.h>

#ifdef _WIN32
    #include <windows.h>
    #include <direct.h>
    #include <io.h>
    #define stat _stat
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
    #include <errno.h>
#endif

namespace rtcdrop {

bool file_exists(const char* path) {
    if (!path) return false;

    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFDIR) != 0;
    }
    return false;
}

bool create_file(const char* path, const char* content) {
    if (!path) return false;

    size_t len = content ? strlen(content) : 0;
    return create_file_binary(path, content, len);
}

bool create_file_binary(const char* path, const void* data, size_t size) {
    if (!path) return false;

    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_ERROR("FS", "Failed to create file: " << path);
        return false;
    }

    if (data && size > 0) {
        size_t written = fwrite(data, 1, size, file);
        if (written != size) {
            fclose(file);
            LOG_ERROR("FS", "Failed to write complete content to file: " << path);
            return false;
        }
    }

    if (fclose(file) != 0) {
        LOG_ERROR("FS", "Failed to flush file: " << path);
        return false;
    }
    return true;
}

char* read_file_text(const char* path, size_t* size_out) {
    if (!path) return nullptr;

    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_ERROR("FS", "Failed to open file for reading: " << path);
        return nullptr;
    }

    // Get file size
    fseek(file, 0, SEEK_END);
    long file_size = ftell(file);
    fseek(file, 0, SEEK_SET);

    if (file_size < 0) {
        LOG_ERROR("FS", "Failed to get file size: " << path);
        fclose(file);
        return nullptr;
    }

    // Allocate buffer (+1 for null terminator)
    char* buffer = (char*)malloc(file_size + 1);
    if (!buffer) {
        LOG_ERROR("FS", "Failed to allocate memory for file: " << path);
        fclose(file);
        return nullptr;
    }

    // Read file
    size_t bytes_read = fread(buffer, 1, file_size, file);
    fclose(file);

    // Null terminate
    buffer[bytes_read] = '\0';

    if (size_out) {
        *size_out = bytes_read;
    }

    return buffer;
}

bool create_directory(const char* path) {
    if (!path) return false;

    if (directory_exists(path)) {
        return true; // Already exists
    }

#ifdef _WIN32
    return _mkdir(path) == 0;
#else
    return mkdir(path, 0755) == 0;
#endif
}

bool create_directories(const char* path) {
    if (!path) return false;

    if (directory_exists(path)) {
        return true; // Already exists
    }

    std::string path_copy(path);

    // Create parent directories first
    for (size_t i = 1; i < path_copy.size(); i++) {
        if (path_copy[i] == '/' || path_copy[i] == '\\') {
            std::string parent = path_copy.substr(0, i);
            if (!directory_exists(parent.c_str()) && !create_directory(parent.c_str())) {
                return false;
            }
        }
    }

    // Create the final directory
    return create_directory(path_copy.c_str());
}

int64_t get_file_size(const char* path) {
    if (!path) return -1;

    struct stat st;
    if (stat(path, &st) == 0) {
        return st.st_size;
    }
    return -1;
}

bool is_file(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFREG) != 0;
    }
    return false;
}

bool is_directory(const char* path) {
    return directory_exists(path);
}

bool delete_file(const char* path) {
    if (!path) return false;

    return remove(path) == 0;
}

bool delete_directory(const char* path) {
    if (!path) return false;

#ifdef _WIN32
    return RemoveDirectoryA(path) != 0;
#else
    return rmdir(path) == 0;
#endif
}

std::string get_filename_from_path(const char* path) {
    if (!path) return "";

    std::string full(path);
    size_t sep = full.find_last_of("/\\");
    if (sep == std::string::npos) {
        return full;
    }
    return full.substr(sep + 1);
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty() || base == ".") {
        return relative;
    }
    if (relative.empty()) {
        return base;
    }

    char last = base[base.size() - 1];
    if (last == '/' || last == '\\') {
        return base + relative;
    }
    return base + "/" + relative;
}

void free_file_buffer(void* buffer) {
    free(buffer);
}

} // namespace rtcdrop
