#pragma once

#include <rvfs/status.h>

#include <compare>
#include <iosfwd>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace rvfs {
    class VfsPath;
    class VfsPathConstIterator;

    using VfsString = std::string;
    using VfsStringView = std::string_view;

    static constexpr char kPathSeparator = '/';

    /// @brief The namespace of the remote vfs that client paths are rooted under.
    static constexpr VfsStringView kDefaultVfsPrefix = "fs/os";

    class VfsPathConstIterator {
        using Iterator = VfsString::const_iterator;

        const VfsString *mString;
        Iterator mIter;

        Iterator nextSegment(Iterator front) const;

        VfsStringView segment() const;

    public:
        VfsPathConstIterator(const VfsString *string, Iterator iter);

        VfsStringView operator*() const;

        VfsPathConstIterator& operator++();

        bool operator==(const VfsPathConstIterator& other) const;
    };

    /// @brief An absolute path on the client filesystem.
    ///
    /// Paths always begin with a separator, the root path is a single separator
    /// and has no segments.
    class VfsPath {
        VfsString mPath;

    public:
        VfsPath();

        /// @pre @a VerifyPathText(path)
        VfsPath(VfsString path);

        template<size_t N> requires (N > 0)
        VfsPath(const char (&path)[N])
            : VfsPath(VfsString(std::begin(path), std::end(path) - 1))
        { }

        /// @brief The length of the path in bytes.
        ///
        /// @see VfsPath::segmentCount for retrieving the number of segments instead.
        ///
        /// @return The length of the path.
        size_t count() const { return mPath.size(); }

        /// @brief The number of segments in the path.
        ///
        /// @return The number of segments.
        size_t segmentCount() const;

        /// @brief Is this the root path.
        bool isRoot() const { return mPath.size() == 1; }

        VfsPathConstIterator begin() const;
        VfsPathConstIterator end() const;

        /// @brief The string representation of the path.
        ///
        /// @return The string representation of the path.
        VfsStringView string() const { return mPath; }

        /// @brief The parent path for this path.
        ///
        /// @pre @a this->segmentCount() > 0
        ///
        /// @return The parent path.
        VfsPath parent() const;

        /// @brief The name of the current file or folder, including extensions.
        ///
        /// @return The name of the current file or folder, empty for the root.
        VfsStringView name() const;

        /// @brief Append a segment to this path.
        ///
        /// @param segment The segment to append, must not contain a separator.
        ///
        /// @return The joined path.
        VfsPath join(VfsStringView segment) const;

        friend auto operator<=>(const VfsPath& lhs, const VfsPath& rhs) {
            return lhs.mPath <=> rhs.mPath;
        }

        friend bool operator==(const VfsPath& lhs, const VfsPath& rhs) {
            return lhs.mPath == rhs.mPath;
        }
    };

    template<typename H>
    H AbslHashValue(H hash, const VfsPath& path) {
        return H::combine(std::move(hash), path.string());
    }

    std::ostream& operator<<(std::ostream& out, const VfsPath& path);

    namespace detail {
        template<typename... Args>
        VfsString BuildPathText(Args&&... args) {
            VfsString path;

            auto addSegment = [&](auto&& segment) {
                path.push_back(kPathSeparator);
                path.append(segment);
            };

            (addSegment(std::forward<Args>(args)), ...);

            if (path.empty()) {
                path.push_back(kPathSeparator);
            }

            return path;
        }
    }

    template<typename... Args>
    VfsPath BuildPath(Args&&... args) {
        return VfsPath(detail::BuildPathText(std::forward<Args>(args)...));
    }

    bool VerifyPathText(VfsStringView text);

    /// @brief Parse a path from untrusted text.
    ///
    /// @param text The text to parse.
    /// @param path The parsed path.
    ///
    /// @retval RvfsStatusInvalidPath The text is not a valid absolute path.
    RvfsStatus ParsePath(VfsStringView text, VfsPath *path);

    /// @brief Map a client path to its location in the remote vfs.
    ///
    /// @param prefix The remote namespace, usually @a kDefaultVfsPrefix.
    /// @param path The client path.
    ///
    /// @return The remote path, for example "fs/os/etc/hosts".
    VfsString GetVfsPath(VfsStringView prefix, const VfsPath& path);
}
