#include "fs/path.hpp"

#include <algorithm>
#include <ostream>

using namespace rvfs;

VfsPathConstIterator::Iterator VfsPathConstIterator::nextSegment(Iterator front) const {
    auto end = mString->end();

    auto iter = front;
    while (iter != end && *iter != kPathSeparator) {
        iter++;
    }

    return iter;
}

VfsStringView VfsPathConstIterator::segment() const {
    auto back = nextSegment(mIter);
    return VfsStringView(mIter, back);
}

VfsPathConstIterator::VfsPathConstIterator(const VfsString *string, Iterator iter)
    : mString(string)
    , mIter(iter)
{ }

VfsStringView VfsPathConstIterator::operator*() const {
    return segment();
}

VfsPathConstIterator& VfsPathConstIterator::operator++() {
    auto back = nextSegment(mIter);
    if (back != mString->end()) {
        back++;
    }

    mIter = back;

    return *this;
}

bool VfsPathConstIterator::operator==(const VfsPathConstIterator& other) const {
    return mIter == other.mIter;
}

VfsPath::VfsPath()
    : mPath(1, kPathSeparator)
{ }

VfsPath::VfsPath(VfsString path)
    : mPath(std::move(path))
{ }

VfsPathConstIterator VfsPath::begin() const {
    //
    // Skip the leading separator, for the root path this
    // is also the end iterator.
    //
    return VfsPathConstIterator(&mPath, mPath.begin() + 1);
}

VfsPathConstIterator VfsPath::end() const {
    return VfsPathConstIterator(&mPath, mPath.end());
}

size_t VfsPath::segmentCount() const {
    if (isRoot()) return 0;

    return std::ranges::count(mPath, kPathSeparator);
}

VfsPath VfsPath::parent() const {
    size_t tail = mPath.rfind(kPathSeparator);
    if (tail == 0) {
        return VfsPath();
    }

    return VfsPath(mPath.substr(0, tail));
}

VfsStringView VfsPath::name() const {
    size_t tail = mPath.rfind(kPathSeparator);

    return VfsStringView(mPath).substr(tail + 1);
}

VfsPath VfsPath::join(VfsStringView segment) const {
    VfsString path = mPath;
    if (!isRoot()) {
        path.push_back(kPathSeparator);
    }

    path.append(segment);

    return VfsPath(std::move(path));
}

std::ostream& rvfs::operator<<(std::ostream& out, const VfsPath& path) {
    return out << path.string();
}

bool rvfs::VerifyPathText(VfsStringView text) {
    //
    // Paths must be absolute.
    //
    if (text.empty() || text.front() != kPathSeparator) {
        return false;
    }

    //
    // The root path is the only path that may end with a separator.
    //
    if (text.size() == 1) {
        return true;
    }

    if (text.back() == kPathSeparator) {
        return false;
    }

    //
    // Paths cannot contain any empty segments.
    //
    if (text.find("//") != VfsStringView::npos) {
        return false;
    }

    //
    // Paths cannot contain null characters.
    //
    return text.find('\0') == VfsStringView::npos;
}

RvfsStatus rvfs::ParsePath(VfsStringView text, VfsPath *path) {
    if (!VerifyPathText(text)) {
        return RvfsStatusInvalidPath;
    }

    *path = VfsPath(VfsString(text));
    return RvfsStatusSuccess;
}

VfsString rvfs::GetVfsPath(VfsStringView prefix, const VfsPath& path) {
    VfsString result{prefix};
    result.append(path.string());
    return result;
}
