// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_BYTECHANNEL_H
#define CONFORMANCE_BYTECHANNEL_H


#include "ValueCodec.h"

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

namespace Conformance
{
    template<ByteOrder order, class sizeT>
    class BasicOutputChannel;

    /*!
     * Sequential read cursor over a fixed byte array
     * @tparam order Byte order of encoded values
     * @tparam sizeT Type used to encode container lengths
     */
    template<ByteOrder order = Network, class sizeT = uint32_t>
    class BasicInputChannel
    {
    public:
        typedef ValueCodec<order, sizeT> Codec;

        BasicInputChannel() = default;

        explicit BasicInputChannel(std::vector<uint8_t> bytes) : buffer(std::move(bytes))
        {}

        /*!
         * Replace channel contents and rewind the cursor
         * @param bytes New contents, copied into the channel
         */
        void setBuffer(const std::vector<uint8_t> &bytes)
        {
            buffer.assign(bytes.begin(), bytes.end());
            offset = 0;
        }

        //! Amount of bytes not read yet
        size_t available() const noexcept
        {
            return buffer.size() - offset;
        }

        //! Amount of bytes already read
        size_t position() const noexcept
        {
            return offset;
        }

        /*!
         * Read a single encoded value
         * @tparam T Serializable value type
         * @param val Decoded value will be stored here
         * @throws DeserializationError if there is not enough bytes left
         * @note Cursor is only advanced if the whole value was decoded
         */
        template<class T>
        void read(T &val)
        {
            const uint8_t *ptr = buffer.data() + offset;
            size_t restSize = available();
            Codec::take(ptr, restSize, val);
            offset = buffer.size() - restSize;
        }

        template<class T>
        T read()
        {
            T val{};
            read(val);
            return val;
        }

        /*!
         * Copy raw bytes out of the channel
         * @param data Destination, must be at least length bytes
         * @param length Amount of bytes to copy
         */
        void readRaw(void *data, size_t length)
        {
            auto ptr = consume(length);
            if (length > 0)
            {
                memcpy(data, ptr, length);
            }
        }

        void skipBytesToRead(size_t numBytes)
        {
            consume(numBytes);
        }

    private:
        friend class BasicOutputChannel<order, sizeT>;

        const uint8_t *consume(size_t numBytes)
        {
            if (available() < numBytes)
            {
                throw DeserializationError("Provided serialized data size is too small");
            }
            auto ptr = buffer.data() + offset;
            offset += numBytes;
            return ptr;
        }

        std::vector<uint8_t> buffer;
        size_t offset = 0;
    };

    /*!
     * Append only, growable byte buffer
     * @tparam order Byte order of encoded values
     * @tparam sizeT Type used to encode container lengths
     */
    template<ByteOrder order = Network, class sizeT = uint32_t>
    class BasicOutputChannel
    {
    public:
        typedef ValueCodec<order, sizeT> Codec;
        typedef BasicInputChannel<order, sizeT> InputView;

        BasicOutputChannel() = default;

        explicit BasicOutputChannel(size_t initialCapacity)
        {
            buffer.reserve(initialCapacity);
        }

        /*!
         * Append a single encoded value
         * @tparam T Serializable value type
         * @param val Value to encode
         */
        template<class T>
        void write(const T &val)
        {
            Codec::append(buffer, val);
        }

        void writeRaw(const void *data, size_t length)
        {
            auto ptr = reinterpret_cast<const uint8_t *>(data);
            buffer.insert(buffer.end(), ptr, ptr + length);
        }

        //! Append numBytes zero bytes
        void skipBytesToWrite(size_t numBytes)
        {
            buffer.insert(buffer.end(), numBytes, 0);
        }

        /*!
         * Move raw bytes from an input channel without decoding them
         * @param source Channel to read from, its cursor is advanced by numBytes
         * @param numBytes Amount of bytes to move
         * @throws DeserializationError if source has less than numBytes available, nothing is copied then
         */
        void write(InputView &source, size_t numBytes)
        {
            auto ptr = source.consume(numBytes);
            buffer.insert(buffer.end(), ptr, ptr + numBytes);
        }

        /*!
         * Freeze the bytes written so far into an independent input channel
         * @note Later writes into this channel are not visible through the returned view
         */
        InputView getInputView() const
        {
            return InputView(buffer);
        }

        size_t size() const noexcept
        {
            return buffer.size();
        }

        const std::vector<uint8_t> &data() const noexcept
        {
            return buffer;
        }

        //! Drop contents, capacity is kept
        void clear() noexcept
        {
            buffer.clear();
        }

    private:
        std::vector<uint8_t> buffer;
    };

    typedef BasicInputChannel<Network, uint32_t> InputChannel;
    typedef BasicOutputChannel<Network, uint32_t> OutputChannel;
}

#endif //CONFORMANCE_BYTECHANNEL_H
