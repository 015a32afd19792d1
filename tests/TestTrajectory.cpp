#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "TestUtil.hpp"
#include "io/Trajectory.hpp"
#include "util/Logging.hpp"

using namespace xdrtraj;
using namespace xdrtraj::testing;

namespace {

Status writeFrames(const std::string& path, const std::vector<Frame>& frames, const TrajectoryOptions& options = {}) {
    std::unique_ptr<Trajectory> traj;
    Status status = openTrajectory(path, FileMode::Write, options, traj);
    for (std::size_t i = 0; status.isOk() && i < frames.size(); ++i) {
        status = traj->write(frames[i]);
    }
    if (!status.isOk()) {
        return status;
    }
    return traj->close();
}

std::vector<int> readSteps(const std::string& path, Status& last) {
    std::vector<int> steps;
    std::unique_ptr<Trajectory> traj;
    last = openTrajectory(path, FileMode::Read, {}, traj);
    if (!last.isOk()) {
        return steps;
    }
    std::size_t natoms = 0;
    last = traj->atomCount(natoms);
    if (!last.isOk()) {
        return steps;
    }
    Frame frame(natoms);
    while ((last = traj->read(frame)).isOk()) {
        steps.push_back(frame.step);
    }
    return steps;
}

bool expect(bool condition, const std::string& what) {
    if (!condition) {
        std::cerr << what << " failed" << std::endl;
    }
    return condition;
}

}  // namespace

int main() {
    Logger::instance().setLevel(LogLevel::Off);
    bool ok = true;

    // Sequential write then read, in order, then a clean end.
    {
        const std::string path = tempPath("ordered.xtc");
        Status status = writeFrames(path, {makeFrame(20, 1, 0.0f), makeFrame(20, 2, 0.5f), makeFrame(20, 3, 1.0f)});
        ok &= expect(status.isOk(), "Writing ordered XTC: " + status.toString());

        std::unique_ptr<Trajectory> traj;
        status = openTrajectory(path, FileMode::Read, {}, traj);
        ok &= expect(status.isOk(), "Opening ordered XTC");
        if (status.isOk()) {
            std::size_t natoms = 0;
            std::size_t frames = 0;
            ok &= expect(traj->atomCount(natoms).isOk() && natoms == 20, "Atom count of ordered XTC");
            ok &= expect(traj->frameCount(frames).isOk() && frames == 3, "Frame count of ordered XTC");
            Frame frame(natoms);
            std::vector<int> steps;
            while ((status = traj->read(frame)).isOk()) {
                steps.push_back(frame.step);
            }
            ok &= expect(status.isEndOfFile(), "End of ordered XTC is EndOfFile");
            ok &= expect(steps == std::vector<int>({1, 2, 3}), "Step order");
            ok &= expect(frame.step == 3 && frame.natoms() == 20, "Frame untouched by EndOfFile");
            ok &= expect(traj->framesRead() == 3, "Frames read counter");
            ok &= expect(traj->read(frame).isEndOfFile(), "EndOfFile is repeatable");
        }
    }

    // Close is idempotent and the handle cannot be revived.
    {
        const std::string path = tempPath("closed.trr");
        ok &= expect(writeFrames(path, {makeFrame(3, 0, 0.0f)}).isOk(), "Writing closed.trr");
        std::unique_ptr<Trajectory> fresh = createTrajectory(path);
        Frame frame;
        ok &= expect(fresh && fresh->read(frame).kind() == ErrorKind::HandleClosed, "Read on unopened handle");

        std::unique_ptr<Trajectory> traj;
        ok &= expect(openTrajectory(path, FileMode::Read, {}, traj).isOk(), "Opening closed.trr");
        if (traj) {
            ok &= expect(traj->close().isOk(), "First close");
            ok &= expect(traj->close().isOk(), "Second close");
            ok &= expect(!traj->isOpen(), "Closed handle reports not open");
            ok &= expect(traj->read(frame).kind() == ErrorKind::HandleClosed, "Read after close");
            std::size_t natoms = 0;
            ok &= expect(traj->atomCount(natoms).kind() == ErrorKind::HandleClosed, "Atom count after close");
            ok &= expect(traj->open(path, FileMode::Read).kind() == ErrorKind::HandleClosed, "Reopen after close");
        }
    }

    // The atom count is fixed by the first write; the file keeps only valid frames.
    {
        const std::string path = tempPath("mismatch.xtc");
        std::unique_ptr<Trajectory> traj;
        Status status = openTrajectory(path, FileMode::Write, {}, traj);
        ok &= expect(status.isOk(), "Opening mismatch.xtc for writing");
        if (status.isOk()) {
            ok &= expect(!traj->hasAtomCount(), "No atom count before first write");
            ok &= expect(traj->write(makeFrame(10, 1, 0.0f)).isOk(), "First write");
            std::size_t natoms = 0;
            ok &= expect(traj->atomCount(natoms).isOk() && natoms == 10, "Atom count fixed by first write");
            status = traj->write(makeFrame(12, 2, 0.1f));
            ok &= expect(status.kind() == ErrorKind::AtomCountMismatch, "Second write with 12 atoms");
            ok &= expect(status.frameIndex() && *status.frameIndex() == 1, "Mismatch carries frame index");
            ok &= expect(traj->close().isOk(), "Closing mismatch.xtc");
        }
        Status last;
        std::vector<int> steps = readSteps(path, last);
        ok &= expect(steps == std::vector<int>({1}) && last.isEndOfFile(), "Only the valid frame survives");
    }

    // Velocities and forces must match the atom count too.
    {
        const std::string path = tempPath("velocities.trr");
        std::unique_ptr<Trajectory> traj;
        Status status = openTrajectory(path, FileMode::Write, {}, traj);
        if (status.isOk()) {
            Frame frame = makeFrame(4, 0, 0.0f);
            frame.velocities.assign(3, Vec3{});
            ok &= expect(traj->write(frame).kind() == ErrorKind::AtomCountMismatch, "Short velocity block");
            frame.velocities.assign(4, Vec3{1.0f, 2.0f, 3.0f});
            frame.forces.assign(5, Vec3{});
            ok &= expect(traj->write(frame).kind() == ErrorKind::AtomCountMismatch, "Long force block");
            ok &= expect(!traj->hasAtomCount(), "Rejected frames do not fix the atom count");
            frame.forces.clear();
            ok &= expect(traj->write(frame).isOk(), "Frame with velocities only");
        } else {
            ok &= expect(false, "Opening velocities.trr");
        }
    }

    // A file cut inside the second record is Truncated, not EndOfFile.
    for (const char* name : {"truncated.xtc", "truncated.trr"}) {
        const std::string path = tempPath(name);
        ok &= expect(writeFrames(path, {makeFrame(30, 1, 0.0f), makeFrame(30, 2, 0.5f)}).isOk(),
                     std::string("Writing ") + name);
        const auto full = std::filesystem::file_size(path);
        std::filesystem::resize_file(path, full - 5);

        std::unique_ptr<Trajectory> traj;
        Status status = openTrajectory(path, FileMode::Read, {}, traj);
        ok &= expect(status.isOk(), std::string("Opening ") + name);
        if (status.isOk()) {
            Frame frame(30);
            ok &= expect(traj->read(frame).isOk() && frame.step == 1, std::string("First frame of ") + name);
            std::int64_t before = 0;
            traj->tell(before);
            status = traj->read(frame);
            ok &= expect(status.kind() == ErrorKind::Truncated, std::string("Truncated kind for ") + name + ": " +
                                                                     status.toString());
            ok &= expect(status.frameIndex() && *status.frameIndex() == 1, "Truncated frame index");
            std::int64_t after = -1;
            traj->tell(after);
            ok &= expect(before == after, "Cursor restored after failed read");
            ok &= expect(frame.step == 1, "Caller frame untouched by failed read");
            std::size_t frames = 0;
            ok &= expect(traj->frameCount(frames).kind() == ErrorKind::Truncated, "Frame count of cut file");
        }
    }

    // Cut inside the magic word of the second record.
    {
        const std::string path = tempPath("cutmagic.xtc");
        ok &= expect(writeFrames(path, {makeFrame(3, 1, 0.0f)}).isOk(), "Writing cutmagic.xtc");
        {
            std::ofstream out(path, std::ios::binary | std::ios::app);
            out.put('\0');
            out.put('\0');
        }
        Status last;
        std::vector<int> steps = readSteps(path, last);
        ok &= expect(steps.size() == 1 && last.kind() == ErrorKind::Truncated, "Partial magic is Truncated");
    }

    // An empty file is an empty trajectory.
    {
        const std::string path = tempPath("empty.xtc");
        { std::ofstream touch(path, std::ios::binary); }
        std::unique_ptr<Trajectory> traj;
        Status status = openTrajectory(path, FileMode::Read, {}, traj);
        ok &= expect(status.isOk(), "Opening empty.xtc");
        if (status.isOk()) {
            std::size_t natoms = 7;
            std::size_t frames = 7;
            ok &= expect(traj->atomCount(natoms).isOk() && natoms == 0, "Empty trajectory atom count");
            ok &= expect(traj->frameCount(frames).isOk() && frames == 0, "Empty trajectory frame count");
            Frame frame;
            ok &= expect(traj->read(frame).isEndOfFile(), "First read of empty trajectory");
        }
    }

    // TRR frames without atoms keep their box, step, time and lambda.
    {
        const std::string path = tempPath("empty_frame.trr");
        Frame original = makeFrame(0, 77, 3.5f);
        original.lambda = 0.25f;
        ok &= expect(writeFrames(path, {original, makeFrame(0, 78, 4.0f)}).isOk(), "Writing zero-atom TRR");
        std::unique_ptr<Trajectory> traj;
        Status status = openTrajectory(path, FileMode::Read, {}, traj);
        ok &= expect(status.isOk(), "Opening zero-atom TRR: " + status.toString());
        if (status.isOk()) {
            std::size_t natoms = 5;
            std::size_t frames = 0;
            ok &= expect(traj->atomCount(natoms).isOk() && natoms == 0, "Zero-atom TRR atom count");
            ok &= expect(traj->frameCount(frames).isOk() && frames == 2, "Zero-atom TRR frame count");
            Frame frame = makeFrame(4, 0, 0.0f);
            status = traj->read(frame);
            ok &= expect(status.isOk(), "Reading zero-atom TRR: " + status.toString());
            ok &= expect(frame.coords.empty() && frame.step == 77 && frame.time == 3.5f && frame.lambda == 0.25f &&
                             frame.box == original.box,
                         "Zero-atom TRR frame contents");
            ok &= expect(traj->read(frame).isOk() && frame.step == 78, "Second zero-atom TRR frame");
            ok &= expect(traj->read(frame).isEndOfFile(), "End of zero-atom TRR");
        }
    }

    // Open failures.
    {
        std::unique_ptr<Trajectory> traj;
        ok &= expect(openTrajectory(tempPath("missing.xtc"), FileMode::Read, {}, traj).kind() == ErrorKind::NotFound,
                     "Missing file");
        ok &= expect(openTrajectory((scratchDir() / "no_dir" / "out.xtc").string(), FileMode::Write, {}, traj).kind() ==
                         ErrorKind::NotFound,
                     "Missing directory");
        ok &= expect(openTrajectory(tempPath("frames.pdb"), FileMode::Write, {}, traj).kind() == ErrorKind::InvalidFormat,
                     "Unsupported extension");
        const auto dir = scratchDir() / "dir.xtc";
        std::filesystem::create_directories(dir);
        ok &= expect(openTrajectory(dir.string(), FileMode::Read, {}, traj).kind() == ErrorKind::InvalidFormat,
                     "Directory path");

        const std::string garbage = tempPath("garbage.trr");
        {
            std::ofstream out(garbage, std::ios::binary);
            out << "this is not an XDR trajectory";
        }
        ok &= expect(openTrajectory(garbage, FileMode::Read, {}, traj).kind() == ErrorKind::InvalidFormat, "Bad magic");
        ok &= expect(!traj, "Failed open leaves no handle");
    }

    // One writable handle per path.
    {
        const std::string path = tempPath("exclusive.xtc");
        std::unique_ptr<Trajectory> first;
        std::unique_ptr<Trajectory> second;
        ok &= expect(openTrajectory(path, FileMode::Write, {}, first).isOk(), "First writer");
        if (first) {
            ok &= expect(first->write(makeFrame(20, 1, 0.0f)).isOk() && first->write(makeFrame(20, 2, 0.5f)).isOk() &&
                             first->flush().isOk(),
                         "First writer's frames");
        }
        Status refused = openTrajectory(path, FileMode::Append, {}, second);
        ok &= expect(refused.kind() == ErrorKind::PermissionDenied, "Second writer refused: " + refused.toString());
        ok &= expect(!second, "Refused writer leaves no handle");
        if (first) {
            ok &= expect(first->write(makeFrame(20, 3, 1.0f)).isOk(), "First writer continues after refusal");
            Frame frame;
            ok &= expect(first->read(frame).kind() == ErrorKind::PermissionDenied, "Read on write handle");
            ok &= expect(first->seek(0).kind() == ErrorKind::PermissionDenied, "Seek on write handle");
            first->close();
        }
        Status last;
        ok &= expect(readSteps(path, last) == std::vector<int>({1, 2, 3}) && last.isEndOfFile(),
                     "Refused writer left the file alone");
        ok &= expect(openTrajectory(path, FileMode::Write, {}, second).isOk(), "Writer after close");
        std::unique_ptr<Trajectory> reader;
        ok &= expect(openTrajectory(path, FileMode::Read, {}, reader).isOk(), "Reader beside writer");
        if (reader) {
            ok &= expect(reader->write(makeFrame(0, 0, 0.0f)).kind() == ErrorKind::PermissionDenied,
                         "Write on read handle");
        }
    }

    // Byte positions round trip through tell and seek.
    {
        const std::string path = tempPath("seek.trr");
        ok &= expect(writeFrames(path, {makeFrame(8, 10, 0.0f), makeFrame(8, 20, 0.1f), makeFrame(8, 30, 0.2f)}).isOk(),
                     "Writing seek.trr");
        std::unique_ptr<Trajectory> traj;
        if (openTrajectory(path, FileMode::Read, {}, traj).isOk()) {
            Frame frame(8);
            std::int64_t second = 0;
            traj->read(frame);
            traj->tell(second);
            traj->read(frame);
            traj->read(frame);
            ok &= expect(frame.step == 30, "Third frame step");
            ok &= expect(traj->seek(second).isOk(), "Seek back");
            ok &= expect(traj->read(frame).isOk() && frame.step == 20, "Read after seek");
            ok &= expect(traj->seek(-4).kind() == ErrorKind::InvalidFormat, "Negative offset");
        } else {
            ok &= expect(false, "Opening seek.trr");
        }
    }

    // Append continues an existing file with its atom count.
    {
        const std::string path = tempPath("append.xtc");
        ok &= expect(writeFrames(path, {makeFrame(15, 1, 0.0f), makeFrame(15, 2, 1.0f)}).isOk(), "Writing append.xtc");
        std::unique_ptr<Trajectory> traj;
        Status status = openTrajectory(path, FileMode::Append, {}, traj);
        ok &= expect(status.isOk(), "Opening for append: " + status.toString());
        if (status.isOk()) {
            std::size_t natoms = 0;
            std::size_t frames = 0;
            ok &= expect(traj->hasAtomCount() && traj->atomCount(natoms).isOk() && natoms == 15, "Appended atom count");
            ok &= expect(traj->frameCount(frames).isOk() && frames == 2, "Existing frames");
            ok &= expect(traj->write(makeFrame(16, 3, 2.0f)).kind() == ErrorKind::AtomCountMismatch, "Append mismatch");
            ok &= expect(traj->write(makeFrame(15, 3, 2.0f)).isOk(), "Append frame");
            ok &= expect(traj->flush().isOk(), "Flush");
            ok &= expect(traj->frameCount(frames).isOk() && frames == 3, "Frames after append");
            traj->close();
        }
        Status last;
        ok &= expect(readSteps(path, last) == std::vector<int>({1, 2, 3}) && last.isEndOfFile(), "Appended order");

        // An append target that is not a trajectory is refused and released.
        const std::string garbage = tempPath("append_garbage.xtc");
        {
            std::ofstream out(garbage, std::ios::binary);
            out << "not a trajectory at all";
        }
        std::unique_ptr<Trajectory> other;
        ok &= expect(openTrajectory(garbage, FileMode::Append, {}, other).kind() == ErrorKind::InvalidFormat,
                     "Append onto garbage");
        ok &= expect(openTrajectory(garbage, FileMode::Write, {}, other).isOk(), "Writer after refused append");

        const std::string fresh = tempPath("append_new.trr");
        ok &= expect(openTrajectory(fresh, FileMode::Append, {}, traj).isOk() && !traj->hasAtomCount(),
                     "Append creates a new file");
    }

    // A frame the codec refuses leaves the file at its last good record.
    {
        const std::string path = tempPath("rollback.xtc");
        std::unique_ptr<Trajectory> traj;
        if (openTrajectory(path, FileMode::Write, {}, traj).isOk()) {
            ok &= expect(traj->write(makeFrame(12, 1, 0.0f)).isOk(), "Good frame before rollback");
            Frame bad = makeFrame(12, 2, 0.1f);
            bad.coords[0] = Vec3{5.0e6f, 0.0f, 0.0f};
            ok &= expect(traj->write(bad).kind() == ErrorKind::CodecFailure, "Unencodable frame");
            ok &= expect(traj->write(makeFrame(12, 3, 0.2f)).isOk(), "Good frame after rollback");
            traj->close();
        }
        Status last;
        ok &= expect(readSteps(path, last) == std::vector<int>({1, 3}) && last.isEndOfFile(), "File after rollback");
    }

    // Format selection.
    {
        ok &= expect(createTrajectory("frames.gro") == nullptr, "Unsupported format yields nullptr");
        auto upper = createTrajectory("RUN.XTC");
        ok &= expect(upper && std::string(upper->formatName()) == "XTC", "Case-insensitive extension");
        TrajectoryOptions options;
        options.format = "trr";
        options.trrPrecision = TrrPrecision::Double;
        const std::string path = tempPath("explicit.dat");
        Frame frame = makeFrame(5, 9, 0.125f);
        frame.velocities.assign(5, Vec3{0.1f, 0.2f, 0.3f});
        ok &= expect(writeFrames(path, {frame}, options).isOk(), "Writing explicit TRR");
        std::unique_ptr<Trajectory> traj;
        Frame decoded;
        ok &= expect(openTrajectory(path, FileMode::Read, options, traj).isOk() && traj->read(decoded).isOk() &&
                         decoded.velocities == frame.velocities && decoded.step == 9,
                     "Reading explicit TRR");
    }

    removeScratchDir();
    if (!ok) {
        return 1;
    }
    std::cout << "Trajectory tests passed" << std::endl;
    return 0;
}
